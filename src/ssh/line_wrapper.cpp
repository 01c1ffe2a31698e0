#include "line_wrapper.hpp"

LineWrapper::LineWrapper(std::string prefix, std::shared_ptr<std::ostream> sink)
    : prefix_(std::move(prefix)), sink_(std::move(sink)) {
}

void LineWrapper::write(const char* data, std::size_t len) {
    if (!sink_) return;

    pending_.append(data, len);

    std::string out;
    std::string::size_type start = 0;
    std::string::size_type nl;
    while ((nl = pending_.find('\n', start)) != std::string::npos) {
        out += prefix_;
        out.append(pending_, start, nl - start + 1);
        start = nl + 1;
    }
    pending_.erase(0, start);

    if (!out.empty()) {
        sink_->write(out.data(), static_cast<std::streamsize>(out.size()));
        sink_->flush();
    }
}

void LineWrapper::finish() {
    if (!sink_ || pending_.empty()) return;
    std::string out = prefix_ + pending_;
    pending_.clear();
    sink_->write(out.data(), static_cast<std::streamsize>(out.size()));
    sink_->flush();
}
