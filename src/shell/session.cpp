#include "session.hpp"

#include <istream>
#include <string>

namespace vault {


SessionStats Session::run() {
    std::string line;
    for (;;) {
        if (echo_prompt_)
            out_ << PROMPT << std::flush;

        ReadStatus status = read_line(line);
        if (status == ReadStatus::End)
            break;

        std::string reply;
        if (status == ReadStatus::TooLong) {
            ++stats_.rejected;
            reply = Protocol::format_error("line too long");
        } else {
            reply = handle_line(line);
        }
        if (!reply.empty())
            out_ << reply << std::flush;
    }

    if (echo_prompt_)
        out_ << "\n";
    return stats_;
}

Session::ReadStatus Session::read_line(std::string& line) {
    using traits = std::istream::traits_type;

    line.clear();
    bool got_input = false;
    bool too_long = false;

    for (auto ch = in_.get(); !traits::eq_int_type(ch, traits::eof()); ch = in_.get()) {
        got_input = true;
        if (traits::to_char_type(ch) == '\n')
            return too_long ? ReadStatus::TooLong : ReadStatus::Line;
        if (too_long)
            continue; // drain the rest of the oversized line

        if (line.size() >= MAX_LINE_SIZE) {
            too_long = true;
            line.clear();
            line.shrink_to_fit();
            continue;
        }
        line.push_back(traits::to_char_type(ch));
    }

    // End of input, possibly after an unterminated last line
    if (!got_input)
        return ReadStatus::End;
    return too_long ? ReadStatus::TooLong : ReadStatus::Line;
}

std::string Session::handle_line(std::string_view line) {
    if (line.size() > MAX_LINE_SIZE) {
        ++stats_.rejected;
        return Protocol::format_error("line too long");
    }

    try {
        Command cmd = Protocol::parse(line);
        if (std::holds_alternative<NoOp>(cmd))
            return {};

        std::string reply = CommandDispatcher::execute(cmd, vault_);
        ++stats_.executed;
        return reply;
    } catch (const ProtocolError& e) {
        ++stats_.rejected;
        return Protocol::format_error(e.what());
    }
}

} // namespace vault
