#include "sharebox/protocol.hpp"

#include <array>
#include <stdexcept>

#include "sharebox/encoding/base64.hpp"

namespace sharebox::protocol
{

    namespace
    {

        struct MessageTypeMapping
        {
            MessageType type;
            std::string_view label;
        };

        constexpr std::array<MessageTypeMapping, 4> kMessageTypeMappings{{
            {MessageType::Request, "REQUEST"},
            {MessageType::Response, "RESPONSE"},
            {MessageType::Data, "DATA"},
            {MessageType::Error, "ERROR"},
        }};

        struct CommandMapping
        {
            Command command;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 7> kCommandMappings{{
            {Command::Hello, "hello"},
            {Command::List, "ls"},
            {Command::Copy, "cp"},
            {Command::Put, "put"},
            {Command::Remove, "rm"},
            {Command::Cut, "cut"},
            {Command::Exit, "exit"},
        }};

        std::optional<std::uint64_t> optional_u64(const nlohmann::json &json, const char *key)
        {
            if (auto it = json.find(key); it != json.end() && !it->is_null())
            {
                return it->get<std::uint64_t>();
            }
            return std::nullopt;
        }

        std::optional<std::string> optional_string(const nlohmann::json &json, const char *key)
        {
            if (auto it = json.find(key); it != json.end() && !it->is_null())
            {
                return it->get<std::string>();
            }
            return std::nullopt;
        }

    } // namespace

    std::string_view to_string(MessageType type) noexcept
    {
        for (const auto &mapping : kMessageTypeMappings)
        {
            if (mapping.type == type)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<MessageType> message_type_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kMessageTypeMappings)
        {
            if (mapping.label == value)
            {
                return mapping.type;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.label == value)
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    bool operator==(const Message &lhs, const Message &rhs)
    {
        return lhs.type == rhs.type && lhs.command == rhs.command && lhs.fields == rhs.fields &&
               lhs.binary == rhs.binary;
    }

    void to_json(nlohmann::json &json, const Message &message)
    {
        json = {
            {"type", to_string(message.type)},
            {"command", message.command},
            {"fields", message.fields},
        };
        if (message.binary)
        {
            json["binary"] = encoding::encode_base64(*message.binary);
        }
    }

    void from_json(const nlohmann::json &json, Message &message)
    {
        if (!json.is_object())
        {
            throw std::runtime_error("Frame body is not a JSON object");
        }
        const auto type_label = json.at("type").get<std::string>();
        auto type = message_type_from_string(type_label);
        if (!type)
        {
            throw std::runtime_error("Unknown message type: " + type_label);
        }
        message.type = *type;
        message.command = json.value("command", std::string{});
        message.fields = json.value("fields", nlohmann::json::object());
        if (!message.fields.is_object())
        {
            throw std::runtime_error("Message fields must be an object");
        }
        if (auto it = json.find("binary"); it != json.end() && !it->is_null())
        {
            auto decoded = encoding::decode_base64(it->get<std::string>());
            if (!decoded)
            {
                throw std::runtime_error("Binary payload is not valid base64");
            }
            message.binary = std::move(*decoded);
        }
        else
        {
            message.binary.reset();
        }
    }

    Message make_request(Command command, nlohmann::json fields)
    {
        return Message{
            .type = MessageType::Request,
            .command = std::string(to_string(command)),
            .fields = std::move(fields),
            .binary = std::nullopt,
        };
    }

    Message make_response(std::string_view command, nlohmann::json fields)
    {
        return Message{
            .type = MessageType::Response,
            .command = std::string(command),
            .fields = std::move(fields),
            .binary = std::nullopt,
        };
    }

    Message make_data(std::string_view command, nlohmann::json fields, std::vector<std::byte> binary)
    {
        return Message{
            .type = MessageType::Data,
            .command = std::string(command),
            .fields = std::move(fields),
            .binary = std::move(binary),
        };
    }

    Message make_error(std::string_view command, ErrorCode code, std::string_view detail,
                       std::optional<std::string> transfer_id)
    {
        ErrorInfo info{
            .code = code,
            .detail = std::string(detail),
            .transfer_id = std::move(transfer_id),
        };
        return Message{
            .type = MessageType::Error,
            .command = std::string(command),
            .fields = info,
            .binary = std::nullopt,
        };
    }

    void to_json(nlohmann::json &json, const HelloRequest &request)
    {
        json = {{"alias", request.alias}};
    }

    void from_json(const nlohmann::json &json, HelloRequest &request)
    {
        request.alias = json.value("alias", std::string{});
    }

    void to_json(nlohmann::json &json, const HelloResponse &response)
    {
        json = {
            {"session_id", response.session_id},
            {"alias", response.alias},
            {"chunk_size", response.chunk_size},
            {"max_upload", response.max_upload_bytes},
        };
    }

    void from_json(const nlohmann::json &json, HelloResponse &response)
    {
        response.session_id = json.at("session_id").get<std::string>();
        response.alias = json.value("alias", std::string{});
        response.chunk_size = json.value("chunk_size", 0ULL);
        response.max_upload_bytes = json.value("max_upload", 0ULL);
    }

    void to_json(nlohmann::json &json, const PathRequest &request)
    {
        json = {{"path", request.path}};
    }

    void from_json(const nlohmann::json &json, PathRequest &request)
    {
        request.path = json.at("path").get<std::string>();
    }

    void to_json(nlohmann::json &json, const EntryInfo &entry)
    {
        json = {
            {"name", entry.name},
            {"size", entry.size},
            {"type", entry.is_directory ? "dir" : "file"},
        };
    }

    void from_json(const nlohmann::json &json, EntryInfo &entry)
    {
        entry.name = json.at("name").get<std::string>();
        entry.size = json.value("size", 0ULL);
        entry.is_directory = json.value("type", std::string{"file"}) == "dir";
    }

    void to_json(nlohmann::json &json, const ListResponse &response)
    {
        json = {
            {"path", response.path},
            {"entries", response.entries},
        };
    }

    void from_json(const nlohmann::json &json, ListResponse &response)
    {
        response.path = json.value("path", std::string{});
        response.entries = json.value("entries", std::vector<EntryInfo>{});
    }

    void to_json(nlohmann::json &json, const PutRequest &request)
    {
        json = {{"path", request.path}};
        if (request.size)
        {
            json["size"] = *request.size;
        }
    }

    void from_json(const nlohmann::json &json, PutRequest &request)
    {
        request.path = json.at("path").get<std::string>();
        request.size = optional_u64(json, "size");
    }

    void to_json(nlohmann::json &json, const TransferReady &ready)
    {
        json = {
            {"transfer_id", ready.transfer_id},
            {"status", status::kReady},
            {"chunk_size", ready.chunk_size},
        };
    }

    void from_json(const nlohmann::json &json, TransferReady &ready)
    {
        ready.transfer_id = json.at("transfer_id").get<std::string>();
        ready.chunk_size = json.value("chunk_size", 0ULL);
    }

    void to_json(nlohmann::json &json, const ChunkHeader &header)
    {
        json = {
            {"transfer_id", header.transfer_id},
            {"offset", header.offset},
        };
        if (header.total_size)
        {
            json["size"] = *header.total_size;
        }
    }

    void from_json(const nlohmann::json &json, ChunkHeader &header)
    {
        header.transfer_id = json.at("transfer_id").get<std::string>();
        header.offset = json.value("offset", 0ULL);
        header.total_size = optional_u64(json, "size");
    }

    void to_json(nlohmann::json &json, const TransferSummary &summary)
    {
        json = {
            {"transfer_id", summary.transfer_id},
            {"bytes", summary.bytes},
            {"status", summary.status},
        };
        if (summary.checksum)
        {
            json["checksum"] = *summary.checksum;
        }
    }

    void from_json(const nlohmann::json &json, TransferSummary &summary)
    {
        summary.transfer_id = json.at("transfer_id").get<std::string>();
        summary.bytes = json.value("bytes", 0ULL);
        summary.checksum = optional_string(json, "checksum");
        summary.status = json.value("status", std::string{});
    }

    void to_json(nlohmann::json &json, const DeliveryConfirmation &confirmation)
    {
        json = {
            {"transfer_id", confirmation.transfer_id},
            {"received", confirmation.received},
        };
        if (confirmation.checksum)
        {
            json["checksum"] = *confirmation.checksum;
        }
    }

    void from_json(const nlohmann::json &json, DeliveryConfirmation &confirmation)
    {
        confirmation.transfer_id = json.at("transfer_id").get<std::string>();
        confirmation.received = json.at("received").get<std::uint64_t>();
        confirmation.checksum = optional_string(json, "checksum");
    }

    void to_json(nlohmann::json &json, const ErrorInfo &info)
    {
        json = {
            {"reason", to_string(info.code)},
            {"code", to_int(info.code)},
            {"detail", info.detail},
        };
        if (info.transfer_id)
        {
            json["transfer_id"] = *info.transfer_id;
        }
    }

    void from_json(const nlohmann::json &json, ErrorInfo &info)
    {
        const auto reason = json.value("reason", std::string{});
        if (auto code = error_code_from_string(reason))
        {
            info.code = *code;
        }
        else
        {
            info.code = error_code_from_int(static_cast<std::uint16_t>(json.value("code", 0u)));
        }
        info.detail = json.value("detail", std::string{});
        info.transfer_id = optional_string(json, "transfer_id");
    }

} // namespace sharebox::protocol
