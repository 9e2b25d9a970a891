#include "sharebox/client/session.hpp"

#include <filesystem>
#include <fstream>
#include <span>
#include <system_error>
#include <vector>

#include "sharebox/crypto.hpp"
#include "sharebox/protocol.hpp"

namespace sharebox::client
{

    namespace
    {

        std::filesystem::path partial_path(const std::filesystem::path &target)
        {
            auto partial = target;
            partial += ".part";
            return partial;
        }

        void discard(const std::filesystem::path &path)
        {
            std::error_code ec;
            std::filesystem::remove(path, ec);
        }

    } // namespace

    DownloadResult ClientSession::copy(const std::string &remote_path,
                                       const std::optional<std::filesystem::path> &local_path)
    {
        StreamProgress progress;
        auto result = receive_stream(protocol::Command::Copy, remote_path, local_path, progress);
        logger_.log("transfer", "copied ", remote_path, " -> ", result.local_path.string(), " (", result.bytes,
                    " bytes)");
        return result;
    }

    DownloadResult ClientSession::cut(const std::string &remote_path,
                                      const std::optional<std::filesystem::path> &local_path)
    {
        StreamProgress progress;
        DownloadResult result;
        try
        {
            result = receive_stream(protocol::Command::Cut, remote_path, local_path, progress);
        }
        catch (const RemoteError &)
        {
            throw;
        }
        catch (const std::exception &ex)
        {
            if (progress.ended && !progress.verified && is_open())
            {
                // Report what actually arrived; the server keeps its copy.
                logger_.log("transfer", "cut ", progress.transfer_id, " did not verify: ", ex.what());
                send(protocol::make_response(protocol::to_string(protocol::Command::Cut),
                                             protocol::DeliveryConfirmation{
                                                 .transfer_id = progress.transfer_id,
                                                 .received = progress.received,
                                                 .checksum = progress.checksum,
                                             }));
                expect_response("cut");
                throw std::runtime_error("Server accepted an unverified delivery of " + remote_path);
            }
            // Without a stored local copy there is nothing to confirm. Dropping
            // the connection leaves the source in place.
            close();
            throw;
        }

        send(protocol::make_response(protocol::to_string(protocol::Command::Cut),
                                     protocol::DeliveryConfirmation{
                                         .transfer_id = result.transfer_id,
                                         .received = result.bytes,
                                         .checksum = result.checksum,
                                     }));
        const auto removed = expect_response("cut").fields.get<protocol::TransferSummary>();
        if (removed.status != protocol::status::kRemoved)
        {
            throw std::runtime_error("Unexpected cut status: " + removed.status);
        }
        logger_.log("transfer", "cut ", remote_path, " -> ", result.local_path.string(), " (", result.bytes,
                    " bytes)");
        return result;
    }

    UploadResult ClientSession::put(const std::filesystem::path &local_path, const std::string &remote_path)
    {
        if (!std::filesystem::is_regular_file(local_path))
        {
            throw std::runtime_error("Local file does not exist: " + local_path.string());
        }
        const auto file_size = std::filesystem::file_size(local_path);
        std::ifstream in(local_path, std::ios::binary);
        if (!in.is_open())
        {
            throw std::runtime_error("Could not open local file for reading: " + local_path.string());
        }

        send(protocol::make_request(protocol::Command::Put,
                                    protocol::PutRequest{.path = remote_path, .size = file_size}));
        const auto ready = expect_response("put").fields.get<protocol::TransferReady>();
        const auto chunk_size = ready.chunk_size > 0 ? ready.chunk_size : protocol::kDefaultChunkSize;
        logger_.log("transfer", "put ", local_path.string(), " -> ", remote_path, " as ", ready.transfer_id);

        crypto::StreamingHash hash;
        std::vector<char> buffer(static_cast<std::size_t>(chunk_size));
        std::uint64_t offset = 0;
        while (in)
        {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto read_count = static_cast<std::size_t>(in.gcount());
            if (read_count == 0)
            {
                break;
            }
            const auto bytes = std::as_bytes(std::span(buffer.data(), read_count));
            hash.update(bytes);
            send(protocol::make_data(protocol::to_string(protocol::Command::Put),
                                     protocol::ChunkHeader{.transfer_id = ready.transfer_id, .offset = offset},
                                     std::vector<std::byte>(bytes.begin(), bytes.end())));
            offset += read_count;
        }
        if (in.bad())
        {
            // Ending the stream short makes the server reject the upload.
            logger_.log("error", "read failed on ", local_path.string(), " after ", offset, " bytes");
        }

        const protocol::TransferSummary end_marker{
            .transfer_id = ready.transfer_id,
            .bytes = offset,
            .checksum = hash.finish(),
            .status = {},
        };
        send(protocol::make_response(protocol::to_string(protocol::Command::Put), end_marker));
        const auto stored = expect_response("put").fields.get<protocol::TransferSummary>();
        if (stored.status != protocol::status::kStored)
        {
            throw std::runtime_error("Unexpected put status: " + stored.status);
        }
        return UploadResult{
            .transfer_id = stored.transfer_id,
            .bytes = stored.bytes,
            .checksum = stored.checksum.value_or(*end_marker.checksum),
        };
    }

    DownloadResult ClientSession::receive_stream(protocol::Command command, const std::string &remote_path,
                                                 const std::optional<std::filesystem::path> &local_path,
                                                 StreamProgress &progress)
    {
        const auto target = download_target(remote_path, local_path);
        const auto partial = partial_path(target);
        const auto command_name = std::string(protocol::to_string(command));

        send(protocol::make_request(command, protocol::PathRequest{.path = remote_path}));

        std::ofstream out;
        crypto::StreamingHash hash;
        while (true)
        {
            auto message = receive();
            if (message.type == protocol::MessageType::Error)
            {
                out.close();
                discard(partial);
                const auto info = message.fields.get<protocol::ErrorInfo>();
                logger_.log("rpc", "error=", sharebox::to_string(info.code), " detail=", info.detail);
                throw RemoteError(info.code, info.detail, info.transfer_id);
            }
            if (message.command != command_name)
            {
                close();
                throw std::runtime_error("Unexpected " + message.command + " frame during " + command_name);
            }

            if (message.type == protocol::MessageType::Data)
            {
                const auto header = message.fields.get<protocol::ChunkHeader>();
                if (progress.transfer_id.empty())
                {
                    progress.transfer_id = header.transfer_id;
                    std::filesystem::create_directories(target.parent_path());
                    out.open(partial, std::ios::binary | std::ios::trunc);
                    if (!out.is_open())
                    {
                        close();
                        throw std::runtime_error("Could not open " + partial.string() + " for writing");
                    }
                }
                if (header.transfer_id != progress.transfer_id || header.offset != progress.received)
                {
                    out.close();
                    discard(partial);
                    close();
                    throw std::runtime_error("Out of order chunk for " + header.transfer_id + " at offset " +
                                             std::to_string(header.offset));
                }
                if (!message.binary)
                {
                    out.close();
                    discard(partial);
                    close();
                    throw std::runtime_error("DATA frame without payload during " + command_name);
                }
                const auto &chunk = *message.binary;
                out.write(reinterpret_cast<const char *>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
                if (!out)
                {
                    out.close();
                    discard(partial);
                    close();
                    throw std::runtime_error("Failed writing " + partial.string());
                }
                hash.update(chunk);
                progress.received += chunk.size();
                continue;
            }

            if (message.type != protocol::MessageType::Response)
            {
                close();
                throw std::runtime_error("Unexpected " + std::string(protocol::to_string(message.type)) +
                                         " frame during " + command_name);
            }

            const auto summary = message.fields.get<protocol::TransferSummary>();
            progress.ended = true;
            if (progress.transfer_id.empty())
            {
                // Empty source: no DATA frame preceded the terminator.
                progress.transfer_id = summary.transfer_id;
                std::filesystem::create_directories(target.parent_path());
                out.open(partial, std::ios::binary | std::ios::trunc);
            }
            out.close();
            progress.checksum = hash.finish();

            if (summary.transfer_id != progress.transfer_id || summary.bytes != progress.received)
            {
                discard(partial);
                throw std::runtime_error("Received " + std::to_string(progress.received) + " of " +
                                         std::to_string(summary.bytes) + " bytes for " + remote_path);
            }
            if (summary.checksum && *summary.checksum != progress.checksum)
            {
                discard(partial);
                throw std::runtime_error("Checksum mismatch for " + remote_path);
            }
            progress.verified = true;

            if (out.fail())
            {
                discard(partial);
                throw std::runtime_error("Failed writing " + partial.string());
            }
            std::filesystem::rename(partial, target);
            return DownloadResult{
                .transfer_id = progress.transfer_id,
                .local_path = target,
                .bytes = progress.received,
                .checksum = progress.checksum,
            };
        }
    }

    std::filesystem::path ClientSession::download_target(const std::string &remote_path,
                                                         const std::optional<std::filesystem::path> &local_path) const
    {
        auto name = std::filesystem::path(remote_path).filename();
        if (name.empty() || name == "." || name == "..")
        {
            throw std::runtime_error("Remote path does not name a file: " + remote_path);
        }
        if (!local_path)
        {
            return config_.download_dir / name;
        }
        if (std::filesystem::is_directory(*local_path))
        {
            return *local_path / name;
        }
        return *local_path;
    }

} // namespace sharebox::client
