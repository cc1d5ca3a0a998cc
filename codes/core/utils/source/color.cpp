#include "utils/color.hpp"

namespace rpc_snoop {
namespace utils {

ColorPalette::ColorPalette(bool enabled)
    : info(enabled ? ANSI_FG_CYAN : "")
    , success(enabled ? ANSI_FG_GREEN : "")
    , error(enabled ? ANSI_FG_RED : "")
    , muted(enabled ? ANSI_FG_WHITE : "")
    , reset(enabled ? ANSI_FG_RESET : "")
{
}

std::string color_treat(const std::string& multi_line, const std::string& color,
                        const std::string& reset) {
    std::string result;
    result.reserve(multi_line.size() + 16);

    size_t start = 0;
    while (true) {
        size_t end = multi_line.find('\n', start);
        result += color;
        if (end == std::string::npos) {
            result.append(multi_line, start, std::string::npos);
            result += reset;
            result += '\n';
            break;
        }
        result.append(multi_line, start, end - start);
        result += reset;
        result += '\n';
        start = end + 1;
    }
    return result;
}

std::string strip_ansi(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '\x1b' && i + 1 < text.size() && text[i + 1] == '[') {
            i += 2;
            // 参数与中间字节，直到终止字节 0x40-0x7E
            while (i < text.size()) {
                unsigned char c = static_cast<unsigned char>(text[i]);
                ++i;
                if (c >= 0x40 && c <= 0x7E) {
                    break;
                }
            }
            continue;
        }
        result += text[i];
        ++i;
    }
    return result;
}

} // namespace utils
} // namespace rpc_snoop
