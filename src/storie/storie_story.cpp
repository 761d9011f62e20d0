#include "storie.hpp"
#include <string>
#include <vector>

using namespace storie;

static std::string trim(const std::string &str) {
    size_t start = str.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";

    size_t end = str.find_last_not_of(" \t\r");
    return str.substr(start, end - start + 1);
}

// only fences of the form ```nim on:<event> carry event handlers. everything
// else in the document is left to whoever renders it.
std::vector<story::event_script>
storie::story::extract_event_scripts(std::istream &stream) {
    std::vector<event_script> scripts;

    bool in_code = false;
    bool is_event = false;
    event_script current;

    std::string line;
    int line_no = 0;

    while (std::getline(stream, line)) {
        ++line_no;
        std::string stripped = trim(line);

        if (stripped.compare(0, 3, "```") == 0) {
            // closing fence
            if (in_code) {
                if (is_event)
                    scripts.push_back(std::move(current));

                in_code = false;
                is_event = false;
                continue;
            }

            // opening fence: ```<lang> <meta>
            in_code = true;
            std::string info = trim(stripped.substr(3));
            size_t space = info.find(' ');
            std::string lang = info.substr(0, space);
            std::string meta = space == std::string::npos ? "" : trim(info.substr(space + 1));

            is_event = lang == "nim" && meta.compare(0, 3, "on:") == 0;
            if (is_event) {
                current = event_script {};
                current.event = trim(meta.substr(3));
                current.line = line_no + 1;
            }

            continue;
        }

        if (in_code && is_event) {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();

            if (!current.code.empty() || line_no > current.line)
                current.code.push_back('\n');

            current.code += line;
        }
    }

    // an unterminated fence is dropped, like any other unfinished block
    return scripts;
}
