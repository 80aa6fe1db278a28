#include "ads_mapping.hpp"
#include "ads_log.hpp"

namespace ads {

Mapping::Mapping(const Device& device, const std::string& symbol, size_t length)
    : handle_(device, symbol), buffer_(length) {}

std::vector<uint8_t> Mapping::buffer() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_;
}

Status Mapping::check_size(size_t type_size) const {
    if (type_size != buffer_.size()) {
        return make_error(ErrorKind::SizeMismatch,
                          handle_.name() + ": type encodes to " + std::to_string(type_size) +
                          " bytes, mapping holds " + std::to_string(buffer_.size()));
    }
    return Status();
}

Status Mapping::read_buffer() {
    auto got = handle_.read_into(buffer_.data(), buffer_.size());
    if (got.kind() == ErrorKind::InvalidHandle) {
        log::get_logger("ads_symbol")->info("re-resolving {} after invalid handle", handle_.name());
        Status st = handle_.resolve();
        if (!st.ok()) return st;
        got = handle_.read_into(buffer_.data(), buffer_.size());
    }
    if (!got.ok()) return got.error;
    if (got.value != buffer_.size()) {
        return make_error(ErrorKind::SizeMismatch,
                          handle_.name() + ": got " + std::to_string(got.value) +
                          " bytes, expected " + std::to_string(buffer_.size()));
    }
    return Status();
}

Status Mapping::write_buffer() {
    Status st = handle_.write_from(buffer_.data(), buffer_.size());
    if (st.kind() == ErrorKind::InvalidHandle) {
        log::get_logger("ads_symbol")->info("re-resolving {} after invalid handle", handle_.name());
        st = handle_.resolve();
        if (!st.ok()) return st;
        st = handle_.write_from(buffer_.data(), buffer_.size());
    }
    return st;
}

} // namespace ads
