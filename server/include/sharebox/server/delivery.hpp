#pragma once

#include <cstdint>
#include <string>

#include "sharebox/protocol.hpp"
#include "sharebox/server/filesystem.hpp"

namespace sharebox::server
{

    // What the server streamed during the first phase of a cut.
    struct SentCopy
    {
        std::string transfer_id;
        PathReference source;
        std::uint64_t bytes{};
        std::string checksum;
    };

    // Proof that the client holds a complete copy of a cut source. Only
    // confirm_delivery can create one, and the writer role only deletes a cut
    // source when handed one.
    class ConfirmedCopy
    {
    public:
        const std::string &transfer_id() const noexcept { return sent_.transfer_id; }
        const PathReference &source() const noexcept { return sent_.source; }
        std::uint64_t bytes() const noexcept { return sent_.bytes; }
        const std::string &checksum() const noexcept { return sent_.checksum; }

    private:
        explicit ConfirmedCopy(SentCopy sent) : sent_(std::move(sent)) {}

        friend ConfirmedCopy confirm_delivery(const SentCopy &sent,
                                              const sharebox::protocol::DeliveryConfirmation &confirmation);

        SentCopy sent_;
    };

    // Throws OperationError(IOError) when the reported byte count or checksum
    // does not match what was sent.
    ConfirmedCopy confirm_delivery(const SentCopy &sent, const sharebox::protocol::DeliveryConfirmation &confirmation);

} // namespace sharebox::server
