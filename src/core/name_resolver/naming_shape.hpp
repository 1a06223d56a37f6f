#pragma once

#include <optional>
#include <string>

namespace objcp::core {

// Facts about one enumerated source item that decide its destination name.
// Produced once by a SourceEnumerator and only ever read afterwards.
struct NamingShape {
    std::string source;              // literal source token, e.g. "dir1/dir2" or "gs://b/*.txt"
    std::string expanded_source;     // concrete item, e.g. "dir1/dir2/a/b/c"
    bool names_container = false;    // the literal token denoted a directory/bucket/subdir
    bool is_multi_source_request = false;
    std::optional<bool> destination_had_existing_container;
};

} // namespace objcp::core
