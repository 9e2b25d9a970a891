#include "sharebox/server/session.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "session_common.hpp"

namespace sharebox::server
{

    void Session::handle_list(const protocol::Message &message)
    {
        const auto path = message.fields.value("path", std::string{"."});
        PathReference directory;
        try
        {
            directory = resolve_and_validate(services_.root, path);
        }
        catch (const OperationError &ex)
        {
            log_event(Operation::List, Outcome::Failed, path, ex.what());
            send_error(message.command, ex.code(), ex.what());
            finish_command();
            return;
        }

        open_record(Operation::List, directory.relative);
        services_.workers.list(directory, executor(),
                               [this, self = shared_from_this(), relative = directory.relative](
                                   std::exception_ptr error, std::vector<protocol::EntryInfo> entries)
                               {
                                   if (error)
                                   {
                                       auto failure = session_common::describe_failure(error);
                                       close_record(Outcome::Failed, failure.detail);
                                       if (closed())
                                       {
                                           return;
                                       }
                                       send_error("ls", failure.code, failure.detail);
                                       finish_command();
                                       return;
                                   }
                                   close_record(Outcome::Ok, std::to_string(entries.size()) + " entries");
                                   if (closed())
                                   {
                                       return;
                                   }
                                   const protocol::ListResponse response{
                                       .path = relative,
                                       .entries = std::move(entries),
                                   };
                                   send(protocol::make_response("ls", response));
                                   finish_command();
                               });
    }

    void Session::handle_remove(const protocol::Message &message)
    {
        const auto request = message.fields.get<protocol::PathRequest>();
        PathReference target;
        try
        {
            target = resolve_and_validate(services_.root, request.path);
        }
        catch (const OperationError &ex)
        {
            log_event(Operation::Remove, Outcome::Failed, request.path, ex.what());
            send_error(message.command, ex.code(), ex.what());
            finish_command();
            return;
        }

        open_record(Operation::Remove, target.relative);
        finalizing_ = true;
        services_.workers.remove_file(target, executor(),
                                      [this, self = shared_from_this(), relative = target.relative](std::exception_ptr error)
                                      {
                                          if (error)
                                          {
                                              auto failure = session_common::describe_failure(error);
                                              close_record(Outcome::Failed, failure.detail);
                                              if (closed())
                                              {
                                                  return;
                                              }
                                              send_error("rm", failure.code, failure.detail);
                                              finish_command();
                                              return;
                                          }
                                          close_record(Outcome::Ok);
                                          spdlog::info("{} removed {}", alias_, relative);
                                          if (closed())
                                          {
                                              return;
                                          }
                                          send(protocol::make_response(
                                              "rm", {{"path", relative}, {"status", protocol::status::kRemoved}}));
                                          finish_command();
                                      });
    }

    void Session::handle_exit()
    {
        send(protocol::make_response("exit", {{"status", protocol::status::kBye}}));
        closing_ = true;
        close_reason_ = "client exit";
        inbound_.clear();
        busy_ = false;
    }

} // namespace sharebox::server
