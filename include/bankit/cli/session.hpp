#pragma once

#include <iostream>
#include <optional>
#include <string>

#include <bankit/cli/command.hpp>

namespace bankit::cli {

    /// Interactive menu loop: reads choices from `in`, writes menus and replies to `out`.
    /// Ends on "Exit" or end of input.
    class Session {
      public:
        Session(Bank &bank, std::istream &in, std::ostream &out) : bank_(bank), dispatcher_(bank), in_(in), out_(out) {}

        void run();

      private:
        Bank &bank_;
        Dispatcher dispatcher_;
        std::istream &in_;
        std::ostream &out_;

        /// Print prompt and read one line, nullopt at end of input
        std::optional<std::string> ask(const std::string &prompt);

        /// false when input ended
        bool clientLoop(int64_t client_id);
        void reply(const Command &command);
    };

} // namespace bankit::cli
