#include "extmgr/core/io_interface.hpp"

#include "extmgr/utils/logging.hpp"

namespace extmgr {
namespace core {

BufferedIO::BufferedIO(MessageCatalog catalog, Verbosity verbosity)
    : catalog_(std::move(catalog))
    , verbosity_(verbosity) {}

void BufferedIO::write_error(const Message& message, bool newline, Verbosity verbosity) {
    if (verbosity > verbosity_) {
        return;
    }

    pending_ += catalog_.translate(message.key, message.parameters);
    if (newline) {
        lines_.push_back(pending_);
        pending_.clear();
    }
}

std::string BufferedIO::output() const {
    std::string text;
    for (const auto& line : lines_) {
        text += line;
        text += '\n';
    }
    return text + pending_;
}

void BufferedIO::clear() {
    lines_.clear();
    pending_.clear();
}

LoggingIO::LoggingIO(MessageCatalog catalog, Verbosity verbosity)
    : catalog_(std::move(catalog))
    , verbosity_(verbosity) {}

void LoggingIO::write_error(const Message& message, bool newline, Verbosity verbosity) {
    if (verbosity > verbosity_) {
        return;
    }

    pending_ += catalog_.translate(message.key, message.parameters);
    if (!newline) {
        return;
    }

    if (verbosity <= Verbosity::Normal) {
        EMLOG_INFO(pending_);
    } else {
        EMLOG_DEBUG(pending_);
    }
    pending_.clear();
}

} // namespace core
} // namespace extmgr
