#include "ads_symbol.hpp"
#include "ads_log.hpp"

#include <utility>

namespace ads {

namespace {
std::shared_ptr<spdlog::logger> logger() {
    return log::get_logger("ads_symbol");
}
}

SymbolHandle::SymbolHandle(const Device& device, std::string name)
    : device_(device), name_(std::move(name)) {}

SymbolHandle::~SymbolHandle() {
    // Without a running reader the release could only time out
    const Client& client = device_.client();
    if (client.state() != ConnectionState::Connected || !client.reader_running()) {
        return;
    }
    Status st = release();
    if (!st.ok()) {
        logger()->debug("releasing handle for {} failed: {}", name_, to_string(st.error));
    }
}

bool SymbolHandle::valid_locked() const {
    return handle_.has_value() && session_ == device_.client().session_id();
}

bool SymbolHandle::is_valid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return valid_locked();
}

void SymbolHandle::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    handle_.reset();
}

std::optional<uint32_t> SymbolHandle::raw() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!valid_locked()) return std::nullopt;
    return handle_;
}

Status SymbolHandle::resolve() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (valid_locked()) {
        std::vector<uint8_t> p;
        codec::le32(p, *handle_);
        Status st = device_.write(index::RELEASE_SYMHANDLE, 0, p);
        if (!st.ok()) {
            logger()->debug("releasing old handle {} for {} failed: {}",
                            *handle_, name_, to_string(st.error));
        }
    }
    handle_.reset();
    return resolve_locked();
}

Status SymbolHandle::resolve_locked() {
    // Sample the session first: a reconnect during the request must leave
    // the result invalid rather than valid in the new session.
    const uint64_t session = device_.client().session_id();

    std::vector<uint8_t> w(name_.begin(), name_.end());
    auto reply = device_.read_write(index::GET_SYMHANDLE_BYNAME, 0, 4, w);
    if (!reply.ok()) {
        logger()->debug("resolving {} on {} failed: {}",
                        name_, device_.addr().to_string(), to_string(reply.error));
        return reply.error;
    }
    if (reply.value.size() != 4) {
        return make_error(ErrorKind::SizeMismatch,
                          name_ + ": handle reply has " + std::to_string(reply.value.size()) + " bytes");
    }

    handle_ = codec::rd32(reply.value.data());
    session_ = session;
    logger()->debug("resolved {} on {} to handle 0x{:x} (session {})",
                    name_, device_.addr().to_string(), *handle_, session_);
    return Status();
}

Result<uint32_t> SymbolHandle::acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!valid_locked()) {
        handle_.reset();
        Status st = resolve_locked();
        if (!st.ok()) return st.error;
    }
    return *handle_;
}

Error SymbolHandle::classify(const Error& e, uint32_t used) {
    if (e.kind != ErrorKind::ProtocolError || !errors::Interpreter::is_invalid_handle(e.ads_code)) {
        return e;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (handle_ && *handle_ == used) {
            handle_.reset();
        }
    }
    logger()->info("handle 0x{:x} for {} no longer valid on {}",
                   used, name_, device_.addr().to_string());
    return make_error(ErrorKind::InvalidHandle,
                      name_ + ": " + errors::Interpreter::format_for_log(e.ads_code), e.ads_code);
}

Result<size_t> SymbolHandle::read_into(uint8_t* out, size_t length) {
    auto handle = acquire();
    if (!handle.ok()) return handle.error;

    auto got = device_.read(index::RW_SYMVAL_BYHANDLE, handle.value, out, length);
    if (!got.ok()) return classify(got.error, handle.value);
    return got.value;
}

Status SymbolHandle::write_from(const uint8_t* data, size_t length) {
    auto handle = acquire();
    if (!handle.ok()) return handle.error;

    Status st = device_.write(index::RW_SYMVAL_BYHANDLE, handle.value, data, length);
    if (!st.ok()) return classify(st.error, handle.value);
    return Status();
}

Status SymbolHandle::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!valid_locked()) {
        handle_.reset();
        return Status();
    }
    const uint32_t h = *handle_;
    handle_.reset();

    std::vector<uint8_t> p;
    codec::le32(p, h);
    return device_.write(index::RELEASE_SYMHANDLE, 0, p);
}

} // namespace ads
