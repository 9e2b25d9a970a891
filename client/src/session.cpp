#include "sharebox/client/session.hpp"

#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <array>
#include <cctype>
#include <iostream>
#include <sstream>
#include <vector>

#include "sharebox/crypto.hpp"
#include "sharebox/framing.hpp"

namespace sharebox::client
{

    namespace
    {

        std::string trim(const std::string &input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return "";
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return input.substr(begin, end - begin + 1);
        }

        std::vector<std::string> split_tokens(const std::string &input)
        {
            std::vector<std::string> tokens;
            std::istringstream iss(input);
            std::string token;
            while (iss >> token)
            {
                tokens.push_back(token);
            }
            return tokens;
        }

        std::string to_lower(std::string value)
        {
            for (auto &ch : value)
            {
                ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
            }
            return value;
        }

    } // namespace

    RemoteError::RemoteError(sharebox::ErrorCode code, const std::string &detail,
                             std::optional<std::string> transfer_id)
        : std::runtime_error(std::string(sharebox::to_string(code)) + ": " + detail),
          code_(code),
          transfer_id_(std::move(transfer_id))
    {
    }

    ClientSession::ClientSession(ClientConfig config, Logger logger)
        : config_(std::move(config)),
          logger_(std::move(logger)),
          socket_(io_context_)
    {
        sharebox::crypto::ensure_sodium_init();
    }

    ClientSession::~ClientSession()
    {
        close();
    }

    int ClientSession::run()
    {
        try
        {
            connect();
            const auto welcome = hello();
            std::cout << "Connected to " << config_.host << ':' << config_.port << " as " << welcome.alias
                      << " (session " << welcome.session_id << ")" << std::endl;
            interactive_shell();
        }
        catch (const std::exception &ex)
        {
            std::cerr << "ERROR: " << ex.what() << std::endl;
            logger_.log("error", "fatal: ", ex.what());
            return 1;
        }
        return 0;
    }

    void ClientSession::connect()
    {
        asio::ip::tcp::resolver resolver(io_context_);
        const auto results = resolver.resolve(config_.host, std::to_string(config_.port));
        asio::connect(socket_, results);
        logger_.log("info", "connected to ", config_.host, ':', config_.port);
    }

    protocol::HelloResponse ClientSession::hello()
    {
        send(protocol::make_request(protocol::Command::Hello, protocol::HelloRequest{.alias = config_.alias}));
        auto response = expect_response("hello").fields.get<protocol::HelloResponse>();
        session_id_ = response.session_id;
        max_upload_bytes_ = response.max_upload_bytes;
        logger_.log("info", "identified as ", response.alias, " session=", response.session_id);
        return response;
    }

    protocol::ListResponse ClientSession::list(const std::string &remote_path)
    {
        send(protocol::make_request(protocol::Command::List, protocol::PathRequest{.path = remote_path}));
        return expect_response("ls").fields.get<protocol::ListResponse>();
    }

    void ClientSession::remove(const std::string &remote_path)
    {
        send(protocol::make_request(protocol::Command::Remove, protocol::PathRequest{.path = remote_path}));
        expect_response("rm");
        logger_.log("info", "removed ", remote_path);
    }

    void ClientSession::exit()
    {
        send(protocol::make_request(protocol::Command::Exit));
        expect_response("exit");
        close();
    }

    void ClientSession::send(const protocol::Message &message)
    {
        const auto frame = protocol::encode_frame(message);
        asio::write(socket_, asio::buffer(frame));
    }

    protocol::Message ClientSession::receive()
    {
        std::array<std::uint8_t, protocol::kFrameHeaderSize> header{};
        asio::read(socket_, asio::buffer(header));
        const auto size = protocol::read_frame_length(header);
        protocol::check_frame_length(size, config_.max_frame_bytes);
        std::vector<std::uint8_t> payload(size);
        asio::read(socket_, asio::buffer(payload));
        return protocol::decode_message(payload);
    }

    void ClientSession::close()
    {
        if (!socket_.is_open())
        {
            return;
        }
        std::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        logger_.log("info", "connection closed");
    }

    protocol::Message ClientSession::expect_response(std::string_view command)
    {
        auto message = receive();
        if (message.type == protocol::MessageType::Error)
        {
            const auto info = message.fields.get<protocol::ErrorInfo>();
            logger_.log("rpc", "error=", sharebox::to_string(info.code), " detail=", info.detail);
            throw RemoteError(info.code, info.detail, info.transfer_id);
        }
        if (message.type != protocol::MessageType::Response || message.command != command)
        {
            throw std::runtime_error("Unexpected " + std::string(protocol::to_string(message.type)) + " " +
                                     message.command + " frame while waiting for " + std::string(command));
        }
        logger_.log("rpc", "success cmd=", command);
        return message;
    }

    void ClientSession::interactive_shell()
    {
        while (true)
        {
            std::cout << config_.alias << "> " << std::flush;
            std::string line;
            if (!std::getline(std::cin, line))
            {
                std::cout << std::endl;
                exit();
                break;
            }
            line = trim(line);
            if (line.empty())
            {
                continue;
            }
            logger_.log("cmd", line);

            const auto tokens = split_tokens(line);
            const auto command = to_lower(tokens[0]);
            const std::vector<std::string> args(tokens.begin() + 1, tokens.end());

            if (command == "exit" || command == "quit")
            {
                exit();
                std::cout << "Bye" << std::endl;
                break;
            }
            if (command == "help")
            {
                print_help();
                continue;
            }

            try
            {
                if (!dispatch(command, args))
                {
                    std::cout << "ERROR: unknown command " << tokens[0] << " (try help)" << std::endl;
                }
            }
            catch (const RemoteError &ex)
            {
                std::cout << "ERROR: " << ex.what() << std::endl;
            }
            catch (const std::system_error &ex)
            {
                // The connection is gone; nothing else can succeed.
                logger_.log("error", "connection failed: ", ex.what());
                throw;
            }
            catch (const std::exception &ex)
            {
                std::cout << "ERROR: " << ex.what() << std::endl;
                logger_.log("error", "command failed: ", ex.what());
            }
            if (!is_open())
            {
                throw std::runtime_error("Connection closed");
            }
        }
    }

    bool ClientSession::dispatch(const std::string &command, const std::vector<std::string> &args)
    {
        if (command == "ls")
        {
            handle_list(args);
            return true;
        }
        if (command == "cp")
        {
            handle_copy(args);
            return true;
        }
        if (command == "put")
        {
            handle_put(args);
            return true;
        }
        if (command == "rm")
        {
            handle_remove(args);
            return true;
        }
        if (command == "cut")
        {
            handle_cut(args);
            return true;
        }
        return false;
    }

} // namespace sharebox::client
