#include "runguard.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <fstream>
#include <map>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;

static map<string, string> read_metadata(const filesystem::path &metadata_file) {
    ifstream fin(metadata_file);
    if (!fin)
        throw internal_error("runguard meta file " + metadata_file.string() + " is missing");

    map<string, string> mp;
    string line;
    while (getline(fin, line)) {
        size_t colon = line.find(": ");
        if (colon == string::npos) {
            // 值为空的行，比如 "time-result: " 被 trim 之后
            if (!line.empty() && line.back() == ':') mp[line.substr(0, line.size() - 1)] = "";
            continue;
        }
        mp[line.substr(0, colon)] = boost::algorithm::trim_copy(line.substr(colon + 2));
    }
    return mp;
}

template <typename T>
void try_to_parse(const map<string, string> &metadata, const char *key, T &value) {
    auto it = metadata.find(key);
    if (it == metadata.end()) return;
    boost::conversion::try_lexical_convert(it->second, value);
}

bool runguard_result::timed_out() const {
    return !time_result.empty();
}

runguard_result read_runguard_result(const filesystem::path &metafile) {
    auto metadata = read_metadata(metafile);
    runguard_result result;
    try_to_parse(metadata, "cpu-time", result.cpu_time);
    try_to_parse(metadata, "wall-time", result.wall_time);
    try_to_parse(metadata, "exitcode", result.exitcode);
    try_to_parse(metadata, "signal", result.signal);
    try_to_parse(metadata, "memory-bytes", result.memory);
    try_to_parse(metadata, "stdout-bytes", result.stdout_bytes);
    if (metadata.count("time-result")) result.time_result = metadata.at("time-result");
    if (metadata.count("output-truncated")) result.output_truncated = metadata.at("output-truncated");
    if (metadata.count("internal-error")) result.internal_error = metadata.at("internal-error");
    return result;
}

}  // namespace grader
