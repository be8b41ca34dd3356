#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace chunkvault::encoding
{

    std::string encode_base64(std::span<const std::byte> data);

    // Returns std::nullopt when the input contains characters outside the alphabet.
    std::optional<std::vector<std::byte>> decode_base64(std::string_view input);

} // namespace chunkvault::encoding
