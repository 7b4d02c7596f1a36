// ============================================================
// output_dir.cpp
// ============================================================

#include "output_dir.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <iomanip>
#include <sstream>
#include <system_error>
#include <unistd.h>

AdmissionPolicy accept_all() {
    return [](const std::string&, u64) { return std::string(); };
}

AdmissionPolicy reject_larger_than(u64 max_bytes) {
    return [max_bytes](const std::string&, u64 file_size) {
        if (file_size <= max_bytes) return std::string();
        return "file size " + std::to_string(file_size) +
               " exceeds limit of " + std::to_string(max_bytes) + " bytes";
    };
}

// ============================================================
// ReceiveSink
// ============================================================

ReceiveSink::ReceiveSink(NameRegistry::Guard reservation, fs::path final_path)
    : reservation_(std::move(reservation))
    , final_path_(std::move(final_path))
{}

ReceiveSink::~ReceiveSink() {
    if (committed_ || temp_path_.empty()) return;
    std::error_code ec;
    fs::remove(temp_path_, ec);
    if (ec) {
        LOG_WARN("Cannot remove partial file " + temp_path_.string() + ": " + ec.message());
    }
}

void ReceiveSink::open(u64 size) {
    std::ostringstream name;
    name << ".peercp-" << std::hex << std::setw(16) << std::setfill('0')
         << utils::generate_id() << ".part";
    temp_path_ = final_path_.parent_path() / name.str();
    writer_.open(temp_path_.string(), size);
}

void ReceiveSink::write(const u8* data, size_t len) {
    writer_.write_at(offset_, data, len);
    offset_ += len;
}

void ReceiveSink::commit() {
    writer_.close();
    fs::rename(temp_path_, final_path_);
    committed_ = true;
}

// ============================================================
// OutputDirectory
// ============================================================

OutputDirectory::OutputDirectory(const std::string& root, bool allow_overwrite,
                                 AdmissionPolicy policy)
    : root_(root)
    , allow_overwrite_(allow_overwrite)
    , policy_(std::move(policy))
{}

Admission OutputDirectory::admit(const std::string& file_name, u64 file_size) {
    std::string problem = file_io::file_name_problem(file_name);
    if (!problem.empty()) {
        LOG_WARN("Refusing offered name: " + problem);
        return Admission::reject("invalid file name: " + problem, ErrorKind::PATH_SECURITY);
    }

    if (policy_) {
        std::string why = policy_(file_name, file_size);
        if (!why.empty()) return Admission::reject(why);
    }

    // The output filesystem may allow fewer than NAME_MAX bytes
    long name_max = ::pathconf(root_.c_str(), _PC_NAME_MAX);
    if (name_max > 0 && file_name.size() > (size_t)name_max) {
        return Admission::reject("invalid file name: longer than " + std::to_string(name_max) +
                                 " bytes", ErrorKind::PATH_SECURITY);
    }

    fs::path final_path = file_io::resolve_in(root_, file_name);

    bool exists = false;
    std::string stat_error;
    bool reserved = registry_.try_reserve(file_name, [&](const std::string&) {
        if (allow_overwrite_) return false;
        std::error_code ec;
        fs::file_status st = fs::symlink_status(final_path, ec);
        if (st.type() == fs::file_type::not_found) return false;
        if (ec) {
            stat_error = ec.message();
        } else {
            exists = true;
        }
        return true;
    });
    if (!reserved) {
        if (!stat_error.empty()) {
            LOG_WARN("Cannot check destination " + final_path.string() + ": " + stat_error);
            return Admission::reject("cannot check destination: " + stat_error, ErrorKind::IO);
        }
        return Admission::reject(exists ? "file already exists"
                                        : "file name is being received by another session");
    }

    return Admission::accept(std::make_unique<ReceiveSink>(
        NameRegistry::Guard(registry_, file_name), final_path));
}
