#pragma once

// ============================================================
// output_dir.hpp -- Where received files land
//
// OutputDirectory is the receiver's ReceiveTarget: it guards
// offered names, applies the admission policy, reserves the
// destination and hands out ReceiveSinks. A sink writes into a
// hidden temp file and renames it onto the final name only on
// commit, so a failed session never leaves a partial file at
// the destination.
// ============================================================

#include "../common/platform.hpp"
#include "../common/transfer_io.hpp"
#include "../common/file_io.hpp"
#include "name_registry.hpp"
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace fs = std::filesystem;

// Returns "" to accept an offer, otherwise the NACK reason
using AdmissionPolicy = std::function<std::string(const std::string& file_name, u64 file_size)>;

AdmissionPolicy accept_all();
AdmissionPolicy reject_larger_than(u64 max_bytes);

class ReceiveSink : public FileSink {
public:
    ReceiveSink(NameRegistry::Guard reservation, fs::path final_path);
    ~ReceiveSink() override;

    void open(u64 size) override;
    void write(const u8* data, size_t len) override;
    void commit() override;

    const fs::path& temp_path() const { return temp_path_; }

private:
    NameRegistry::Guard  reservation_;  // released last, after rename/cleanup
    fs::path             final_path_;
    fs::path             temp_path_;
    file_io::MmapWriter  writer_;
    u64                  offset_{0};
    bool                 committed_{false};
};

class OutputDirectory : public ReceiveTarget {
public:
    OutputDirectory(const std::string& root, bool allow_overwrite,
                    AdmissionPolicy policy = accept_all());

    Admission admit(const std::string& file_name, u64 file_size) override;

    const fs::path& root() const { return root_; }
    NameRegistry& registry() { return registry_; }

private:
    fs::path        root_;
    bool            allow_overwrite_;
    AdmissionPolicy policy_;
    NameRegistry    registry_;
};
