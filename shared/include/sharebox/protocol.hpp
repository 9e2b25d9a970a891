/**
 * ShareBox - Shared protocol schema and serialization helpers.
 *
 * Every frame body is a JSON object of the form
 *   {"type": "REQUEST"|"RESPONSE"|"DATA"|"ERROR", "command": "...", "fields": {...}, "binary": "<base64>"}
 * where "binary" is only present on DATA frames.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "sharebox/error_codes.hpp"

namespace sharebox::protocol
{

    enum class MessageType : std::uint8_t
    {
        Request,
        Response,
        Data,
        Error
    };

    std::string_view to_string(MessageType type) noexcept;
    std::optional<MessageType> message_type_from_string(std::string_view value) noexcept;

    enum class Command : std::uint8_t
    {
        Hello,
        List,
        Copy,
        Put,
        Remove,
        Cut,
        Exit
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    struct Message
    {
        MessageType type{MessageType::Request};
        std::string command;
        nlohmann::json fields{nlohmann::json::object()};
        std::optional<std::vector<std::byte>> binary{};
    };

    bool operator==(const Message &lhs, const Message &rhs);

    void to_json(nlohmann::json &json, const Message &message);
    void from_json(const nlohmann::json &json, Message &message);

    Message make_request(Command command, nlohmann::json fields = nlohmann::json::object());
    Message make_response(std::string_view command, nlohmann::json fields = nlohmann::json::object());
    Message make_data(std::string_view command, nlohmann::json fields, std::vector<std::byte> binary);
    Message make_error(std::string_view command, ErrorCode code, std::string_view detail,
                       std::optional<std::string> transfer_id = std::nullopt);

    struct HelloRequest
    {
        std::string alias;
    };

    void to_json(nlohmann::json &json, const HelloRequest &request);
    void from_json(const nlohmann::json &json, HelloRequest &request);

    struct HelloResponse
    {
        std::string session_id;
        std::string alias;
        std::uint64_t chunk_size{};
        std::uint64_t max_upload_bytes{};
    };

    void to_json(nlohmann::json &json, const HelloResponse &response);
    void from_json(const nlohmann::json &json, HelloResponse &response);

    struct PathRequest
    {
        std::string path;
    };

    void to_json(nlohmann::json &json, const PathRequest &request);
    void from_json(const nlohmann::json &json, PathRequest &request);

    struct EntryInfo
    {
        std::string name;
        std::uint64_t size{};
        bool is_directory{};
    };

    void to_json(nlohmann::json &json, const EntryInfo &entry);
    void from_json(const nlohmann::json &json, EntryInfo &entry);

    struct ListResponse
    {
        std::string path;
        std::vector<EntryInfo> entries;
    };

    void to_json(nlohmann::json &json, const ListResponse &response);
    void from_json(const nlohmann::json &json, ListResponse &response);

    struct PutRequest
    {
        std::string path;
        std::optional<std::uint64_t> size{};
    };

    void to_json(nlohmann::json &json, const PutRequest &request);
    void from_json(const nlohmann::json &json, PutRequest &request);

    struct TransferReady
    {
        std::string transfer_id;
        std::uint64_t chunk_size{};
    };

    void to_json(nlohmann::json &json, const TransferReady &ready);
    void from_json(const nlohmann::json &json, TransferReady &ready);

    // Fields of a DATA frame. total_size is set by the server on downloads.
    struct ChunkHeader
    {
        std::string transfer_id;
        std::uint64_t offset{};
        std::optional<std::uint64_t> total_size{};
    };

    void to_json(nlohmann::json &json, const ChunkHeader &header);
    void from_json(const nlohmann::json &json, ChunkHeader &header);

    namespace status
    {
        inline constexpr std::string_view kReady = "ready";
        inline constexpr std::string_view kComplete = "complete";
        inline constexpr std::string_view kStored = "stored";
        inline constexpr std::string_view kAwaitingConfirmation = "awaiting_confirmation";
        inline constexpr std::string_view kRemoved = "removed";
        inline constexpr std::string_view kBye = "bye";
    } // namespace status

    // Terminates a chunk sequence in either direction: the server closes cp/cut
    // streams with it and the client closes put streams with it.
    struct TransferSummary
    {
        std::string transfer_id;
        std::uint64_t bytes{};
        std::optional<std::string> checksum{};
        std::string status;
    };

    void to_json(nlohmann::json &json, const TransferSummary &summary);
    void from_json(const nlohmann::json &json, TransferSummary &summary);

    // Sent by the client after a cut stream to acknowledge the bytes it stored.
    struct DeliveryConfirmation
    {
        std::string transfer_id;
        std::uint64_t received{};
        std::optional<std::string> checksum{};
    };

    void to_json(nlohmann::json &json, const DeliveryConfirmation &confirmation);
    void from_json(const nlohmann::json &json, DeliveryConfirmation &confirmation);

    struct ErrorInfo
    {
        ErrorCode code{ErrorCode::InternalError};
        std::string detail;
        std::optional<std::string> transfer_id{};
    };

    void to_json(nlohmann::json &json, const ErrorInfo &info);
    void from_json(const nlohmann::json &json, ErrorInfo &info);

} // namespace sharebox::protocol
