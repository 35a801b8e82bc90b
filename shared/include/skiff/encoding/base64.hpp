#pragma once

#include <cstddef>
#include <span>
#include <string>

namespace skiff::encoding
{

    std::string encode_base64(std::span<const std::byte> data);

} // namespace skiff::encoding
