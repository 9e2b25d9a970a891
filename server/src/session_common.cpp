#include "session_common.hpp"

#include <filesystem>
#include <system_error>

#include "sharebox/server/filesystem.hpp"

namespace sharebox::server::session_common
{

    Failure describe_failure(std::exception_ptr error)
    {
        try
        {
            std::rethrow_exception(error);
        }
        catch (const OperationError &ex)
        {
            return Failure{.code = ex.code(), .detail = ex.what()};
        }
        catch (const std::filesystem::filesystem_error &ex)
        {
            return Failure{.code = sharebox::ErrorCode::IOError, .detail = ex.what()};
        }
        catch (const std::exception &ex)
        {
            return Failure{.code = sharebox::ErrorCode::IOError, .detail = ex.what()};
        }
        catch (...)
        {
            return Failure{.code = sharebox::ErrorCode::InternalError, .detail = "Unknown worker failure"};
        }
    }

    std::string describe_peer(const asio::ip::tcp::socket &socket)
    {
        std::error_code ec;
        const auto endpoint = socket.remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        try
        {
            return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
        }
        catch (const std::system_error &)
        {
            return "unknown";
        }
    }

} // namespace sharebox::server::session_common
