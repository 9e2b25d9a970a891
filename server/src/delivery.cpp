#include "sharebox/server/delivery.hpp"

namespace sharebox::server
{

    ConfirmedCopy confirm_delivery(const SentCopy &sent, const sharebox::protocol::DeliveryConfirmation &confirmation)
    {
        if (confirmation.transfer_id != sent.transfer_id)
        {
            throw OperationError(sharebox::ErrorCode::IOError,
                                 "Confirmation for " + confirmation.transfer_id + " does not match transfer " +
                                     sent.transfer_id);
        }
        if (confirmation.received != sent.bytes)
        {
            throw OperationError(sharebox::ErrorCode::IOError,
                                 "Client confirmed " + std::to_string(confirmation.received) + " of " +
                                     std::to_string(sent.bytes) + " bytes");
        }
        if (confirmation.checksum && *confirmation.checksum != sent.checksum)
        {
            throw OperationError(sharebox::ErrorCode::IOError, "Client checksum does not match the sent data");
        }
        return ConfirmedCopy(sent);
    }

} // namespace sharebox::server
