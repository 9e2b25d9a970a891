#include "sharebox/server/transfer_ids.hpp"

#include "sharebox/crypto.hpp"

namespace sharebox::server
{

    std::string TransferIdGenerator::next()
    {
        const auto sequence = counter_.fetch_add(1) + 1;
        return "t" + std::to_string(sequence) + "-" + sharebox::crypto::random_hex(4);
    }

} // namespace sharebox::server
