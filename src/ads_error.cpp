#include "ads_error.hpp"
#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace ads {

const char* kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:            return "None";
        case ErrorKind::ConnectFailure:  return "ConnectFailure";
        case ErrorKind::Timeout:         return "Timeout";
        case ErrorKind::ConnectionLost:  return "ConnectionLost";
        case ErrorKind::MalformedFrame:  return "MalformedFrame";
        case ErrorKind::ProtocolError:   return "ProtocolError";
        case ErrorKind::InvalidHandle:   return "InvalidHandle";
        case ErrorKind::SizeMismatch:    return "SizeMismatch";
        case ErrorKind::InvalidArgument: return "InvalidArgument";
    }
    return "Unknown";
}

std::string to_string(const Error& e) {
    std::ostringstream oss;
    oss << kind_name(e.kind);
    if (!e.message.empty()) {
        oss << ": " << e.message;
    }
    if (e.ads_code != 0) {
        oss << " (" << errors::Interpreter::format_for_log(e.ads_code) << ")";
    }
    return oss.str();
}

namespace errors {

namespace {

struct CodeInfo {
    const char* name;
    const char* description;
};

const std::unordered_map<uint32_t, CodeInfo>& code_table() {
    static const std::unordered_map<uint32_t, CodeInfo> table = {
        {0x000, {"ERR_NOERROR", "No error"}},
        {0x001, {"ERR_INTERNAL", "Internal error"}},
        {0x002, {"ERR_NORTIME", "No real time"}},
        {0x003, {"ERR_ALLOCLOCKEDMEM", "Allocation locked, memory error"}},
        {0x004, {"ERR_INSERTMAILBOX", "Mailbox full, ADS message could not be sent"}},
        {0x005, {"ERR_WRONGRECEIVEHMSG", "Wrong receive HMSG"}},
        {0x006, {"ERR_TARGETPORTNOTFOUND", "Target port not found, ADS server not started"}},
        {0x007, {"ERR_TARGETMACHINENOTFOUND", "Target machine not found, missing ADS route"}},
        {0x008, {"ERR_UNKNOWNCMDID", "Unknown command ID"}},
        {0x009, {"ERR_BADTASKID", "Invalid task ID"}},
        {0x00A, {"ERR_NOIO", "No IO"}},
        {0x00B, {"ERR_UNKNOWNAMSCMD", "Unknown AMS command"}},
        {0x00C, {"ERR_WIN32ERROR", "Win32 error"}},
        {0x00D, {"ERR_PORTNOTCONNECTED", "Port not connected"}},
        {0x00E, {"ERR_INVALIDAMSLENGTH", "Invalid AMS length"}},
        {0x00F, {"ERR_INVALIDAMSNETID", "Invalid AMS NetId"}},
        {0x010, {"ERR_LOWINSTLEVEL", "Installation level too low"}},
        {0x011, {"ERR_NODEBUGINTAVAILABLE", "No debugging available"}},
        {0x012, {"ERR_PORTDISABLED", "Port disabled"}},
        {0x013, {"ERR_PORTALREADYCONNECTED", "Port already connected"}},
        {0x014, {"ERR_AMSSYNC_W32ERROR", "AMS sync Win32 error"}},
        {0x015, {"ERR_AMSSYNC_TIMEOUT", "AMS sync timeout"}},
        {0x016, {"ERR_AMSSYNC_AMSERROR", "AMS sync error"}},
        {0x017, {"ERR_AMSSYNC_NOINDEXINMAP", "No index map for AMS sync"}},
        {0x018, {"ERR_INVALIDAMSPORT", "Invalid AMS port"}},
        {0x019, {"ERR_NOMEMORY", "No memory"}},
        {0x01A, {"ERR_TCPSEND", "TCP send error"}},
        {0x01B, {"ERR_HOSTUNREACHABLE", "Host unreachable"}},
        {0x01C, {"ERR_INVALIDAMSFRAGMENT", "Invalid AMS fragment"}},

        {0x500, {"ROUTERERR_NOLOCKEDMEMORY", "Locked memory cannot be allocated"}},
        {0x501, {"ROUTERERR_RESIZEMEMORY", "Router memory size could not be changed"}},
        {0x502, {"ROUTERERR_MAILBOXFULL", "Mailbox full"}},
        {0x503, {"ROUTERERR_DEBUGBOXFULL", "Debug mailbox full"}},
        {0x504, {"ROUTERERR_UNKNOWNPORTTYPE", "Unknown port type"}},
        {0x505, {"ROUTERERR_NOTINITIALIZED", "Router is not initialized"}},
        {0x506, {"ROUTERERR_PORTALREADYINUSE", "Port number already assigned"}},
        {0x507, {"ROUTERERR_NOTREGISTERED", "Port not registered"}},
        {0x508, {"ROUTERERR_NOMOREQUEUES", "Maximum number of ports reached"}},
        {0x509, {"ROUTERERR_INVALIDPORT", "Invalid port"}},
        {0x50A, {"ROUTERERR_NOTACTIVATED", "Router not active"}},

        {0x700, {"ADSERR_DEVICE_ERROR", "General device error"}},
        {0x701, {"ADSERR_DEVICE_SRVNOTSUPP", "Service not supported by server"}},
        {0x702, {"ADSERR_DEVICE_INVALIDGRP", "Invalid index group"}},
        {0x703, {"ADSERR_DEVICE_INVALIDOFFSET", "Invalid index offset"}},
        {0x704, {"ADSERR_DEVICE_INVALIDACCESS", "Reading or writing not permitted"}},
        {0x705, {"ADSERR_DEVICE_INVALIDSIZE", "Parameter size not correct"}},
        {0x706, {"ADSERR_DEVICE_INVALIDDATA", "Invalid data values"}},
        {0x707, {"ADSERR_DEVICE_NOTREADY", "Device not ready to operate"}},
        {0x708, {"ADSERR_DEVICE_BUSY", "Device busy"}},
        {0x709, {"ADSERR_DEVICE_INVALIDCONTEXT", "Invalid operating system context"}},
        {0x70A, {"ADSERR_DEVICE_NOMEMORY", "Insufficient memory"}},
        {0x70B, {"ADSERR_DEVICE_INVALIDPARM", "Invalid parameter values"}},
        {0x70C, {"ADSERR_DEVICE_NOTFOUND", "Not found"}},
        {0x70D, {"ADSERR_DEVICE_SYNTAX", "Syntax error in file or command"}},
        {0x70E, {"ADSERR_DEVICE_INCOMPATIBLE", "Objects do not match"}},
        {0x70F, {"ADSERR_DEVICE_EXISTS", "Object already exists"}},
        {0x710, {"ADSERR_DEVICE_SYMBOLNOTFOUND", "Symbol not found"}},
        {0x711, {"ADSERR_DEVICE_SYMBOLVERSIONINVALID", "Invalid symbol version"}},
        {0x712, {"ADSERR_DEVICE_INVALIDSTATE", "Device in invalid state"}},
        {0x713, {"ADSERR_DEVICE_TRANSMODENOTSUPP", "Transmission mode not supported"}},
        {0x714, {"ADSERR_DEVICE_NOTIFYHNDINVALID", "Notification handle is invalid"}},
        {0x715, {"ADSERR_DEVICE_CLIENTUNKNOWN", "Notification client not registered"}},
        {0x716, {"ADSERR_DEVICE_NOMOREHDLS", "No further notification handle"}},
        {0x717, {"ADSERR_DEVICE_INVALIDWATCHSIZE", "Notification size too large"}},
        {0x718, {"ADSERR_DEVICE_NOTINIT", "Device not initialized"}},
        {0x719, {"ADSERR_DEVICE_TIMEOUT", "Device has a timeout"}},
        {0x71A, {"ADSERR_DEVICE_NOINTERFACE", "Interface query failed"}},
        {0x71B, {"ADSERR_DEVICE_INVALIDINTERFACE", "Wrong interface requested"}},
        {0x71C, {"ADSERR_DEVICE_INVALIDCLSID", "Class ID is invalid"}},
        {0x71D, {"ADSERR_DEVICE_INVALIDOBJID", "Object ID is invalid"}},
        {0x71E, {"ADSERR_DEVICE_PENDING", "Request pending"}},
        {0x71F, {"ADSERR_DEVICE_ABORTED", "Request aborted"}},
        {0x720, {"ADSERR_DEVICE_WARNING", "Signal warning"}},
        {0x721, {"ADSERR_DEVICE_INVALIDARRAYIDX", "Invalid array index"}},
        {0x722, {"ADSERR_DEVICE_SYMBOLNOTACTIVE", "Symbol not active"}},
        {0x723, {"ADSERR_DEVICE_ACCESSDENIED", "Access denied"}},
        {0x724, {"ADSERR_DEVICE_LICENSENOTFOUND", "Missing license"}},
        {0x725, {"ADSERR_DEVICE_LICENSEEXPIRED", "License expired"}},
        {0x726, {"ADSERR_DEVICE_LICENSEEXCEEDED", "License exceeded"}},
        {0x727, {"ADSERR_DEVICE_LICENSEINVALID", "Invalid license"}},

        {0x740, {"ADSERR_CLIENT_ERROR", "Client error"}},
        {0x741, {"ADSERR_CLIENT_INVALIDPARM", "Service contains an invalid parameter"}},
        {0x742, {"ADSERR_CLIENT_LISTEMPTY", "Polling list is empty"}},
        {0x743, {"ADSERR_CLIENT_VARUSED", "Var connection already in use"}},
        {0x744, {"ADSERR_CLIENT_DUPLINVOKEID", "Invoke ID already in use"}},
        {0x745, {"ADSERR_CLIENT_SYNCTIMEOUT", "Timeout elapsed"}},
        {0x746, {"ADSERR_CLIENT_W32ERROR", "Error in Win32 subsystem"}},
        {0x747, {"ADSERR_CLIENT_TIMEOUTINVALID", "Invalid client timeout value"}},
        {0x748, {"ADSERR_CLIENT_PORTNOTOPEN", "Port not open"}},
        {0x749, {"ADSERR_CLIENT_NOAMSADDR", "No AMS address"}},
        {0x750, {"ADSERR_CLIENT_SYNCINTERNAL", "Internal error in ADS sync"}},
        {0x751, {"ADSERR_CLIENT_ADDHASH", "Hash table overflow"}},
        {0x752, {"ADSERR_CLIENT_REMOVEHASH", "Key not found in hash table"}},
        {0x753, {"ADSERR_CLIENT_NOMORESYM", "No symbols in cache"}},
        {0x754, {"ADSERR_CLIENT_SYNCRESINVALID", "Invalid response received"}},
        {0x755, {"ADSERR_CLIENT_SYNCPORTLOCKED", "Sync port is locked"}},
    };
    return table;
}

} // namespace

std::string Interpreter::get_name(uint32_t code) {
    const auto& table = code_table();
    auto it = table.find(code);
    return it != table.end() ? it->second.name : "ADSERR_UNKNOWN";
}

std::string Interpreter::get_description(uint32_t code) {
    const auto& table = code_table();
    auto it = table.find(code);
    return it != table.end() ? it->second.description : "Unknown ADS error";
}

Category Interpreter::get_category(uint32_t code) {
    if (code == NoError) return Category::None;
    if (code <= 0x01C) return Category::Global;
    if (code >= 0x500 && code <= 0x50A) return Category::Router;
    if (code >= 0x700 && code < 0x740) return Category::Device;
    if (code >= 0x740 && code < 0x760) return Category::Client;
    return Category::Unknown;
}

bool Interpreter::is_transient(uint32_t code) {
    switch (code) {
        case 0x004:   // mailbox full
        case 0x502:
        case DeviceNotReady:
        case DeviceBusy:
        case DeviceTimeout:
        case 0x71E:   // pending
        case ClientTimeout:
            return true;
        default:
            return false;
    }
}

std::string Interpreter::format_for_log(uint32_t code) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::uppercase << std::setw(4) << std::setfill('0') << code
        << ": " << get_name(code) << " - " << get_description(code);
    return oss.str();
}

} // namespace errors

} // namespace ads
