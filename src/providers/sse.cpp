#include "sse.hpp"

namespace chatrelay {

bool SSEParser::feed(const std::string& chunk, const SSECallback& callback) {
    buffer_ += chunk;

    size_t pos = 0;
    while (pos < buffer_.size()) {
        size_t newline = buffer_.find('\n', pos);
        if (newline == std::string::npos) break; // incomplete line

        std::string line = buffer_.substr(pos, newline - pos);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        pos = newline + 1;

        if (line.empty()) {
            // Empty line = dispatch event
            if (has_data_) {
                SSEEvent event{event_, data_};
                event_.clear();
                data_.clear();
                has_data_ = false;
                if (!callback(event)) {
                    buffer_.erase(0, pos);
                    return false;
                }
            }
            event_.clear();
        } else if (line[0] == ':') {
            comments_++;
        } else if (line.rfind("event:", 0) == 0) {
            event_ = line.substr(line.size() > 6 && line[6] == ' ' ? 7 : 6);
        } else if (line.rfind("data:", 0) == 0) {
            if (has_data_) {
                data_ += '\n';
            }
            // Handle both "data: payload" (with space) and "data:payload" (without)
            data_ += line.substr(line.size() > 5 && line[5] == ' ' ? 6 : 5);
            has_data_ = true;
        }
        // Other fields (id:, retry:) are ignored
    }

    buffer_.erase(0, pos);
    return true;
}

void SSEParser::reset() {
    buffer_.clear();
    event_.clear();
    data_.clear();
    has_data_ = false;
    comments_ = 0;
}

} // namespace chatrelay
