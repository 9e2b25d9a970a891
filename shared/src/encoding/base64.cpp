#include "sharebox/encoding/base64.hpp"

#include <sodium.h>

namespace sharebox::encoding
{

    namespace
    {
        constexpr int kVariant = sodium_base64_VARIANT_ORIGINAL;
    } // namespace

    std::string encode_base64(std::span<const std::byte> data)
    {
        if (data.empty())
        {
            return {};
        }
        const auto encoded_length = sodium_base64_ENCODED_LEN(data.size(), kVariant);
        std::string output(encoded_length, '\0');
        sodium_bin2base64(output.data(), output.size(), reinterpret_cast<const unsigned char *>(data.data()),
                          data.size(), kVariant);
        // encoded_length accounts for the trailing NUL written by libsodium
        output.resize(encoded_length - 1);
        return output;
    }

    std::optional<std::vector<std::byte>> decode_base64(std::string_view input)
    {
        if (input.empty())
        {
            return std::vector<std::byte>{};
        }
        std::vector<std::byte> output((input.size() / 4 + 1) * 3);
        std::size_t decoded_length = 0;
        const char *end = nullptr;
        const auto status = sodium_base642bin(reinterpret_cast<unsigned char *>(output.data()), output.size(),
                                              input.data(), input.size(), nullptr, &decoded_length, &end, kVariant);
        if (status != 0 || end != input.data() + input.size())
        {
            return std::nullopt;
        }
        output.resize(decoded_length);
        return output;
    }

} // namespace sharebox::encoding
