#pragma once
#include <filesystem>
#include <future>
#include <string>
#include <vector>

#include "config/Options.hpp"
#include "core/AdmissionGate.hpp"
#include "core/cancel.hpp"

namespace ListFile {

// validates requests against the options, takes an admission slot, opens the
// file and runs get_last_lines() on it. holds no per-request state, so one
// instance can serve any number of concurrent calls
class FileLister {
    public:
    FileLister(const ListerOptions& options, AdmissionGate& gate);

    std::vector<std::string> get_last_lines(const std::filesystem::path& fname, int line_count, const CancelToken& cancel = {}) const;
    std::vector<std::string> get_last_lines(const std::filesystem::path& fname, const CancelToken& cancel = {}) const {
        return get_last_lines(fname, m_options.default_line_count, cancel);
    }

    // same as get_last_lines(), on a worker thread. errors are rethrown by future::get()
    // the future keeps its own copy of the options and may outlive the lister, not the gate
    std::future<std::vector<std::string>> get_last_lines_async(const std::filesystem::path& fname, int line_count, const CancelToken& cancel = {}) const;

    const ListerOptions& options() const { return m_options; }

    private:
    void validate(const std::filesystem::path& fname, int line_count) const;

    const ListerOptions m_options;
    AdmissionGate& m_gate;
};

} // namespace ListFile
