#pragma once

#include <optional>
#include "core/name_resolver/naming_shape.hpp"
#include "core/storage_url/storage_url.hpp"
#include "infra/error_handler/error.hpp"

namespace objcp::core {

/// Computes the destination of one transferred item.
///
/// - single non-container source to a non-container destination: the
///   destination itself;
/// - individual items (including wildcard matches): destination container
///   plus the final path component of the item;
/// - items of a container copy: destination container plus the item path
///   relative to the parent of the expansion root, so "dir1/dir2/a/b/c"
///   copied from "dir1/dir2" lands at "<dst>/dir2/a/b/c". When the destination
///   is a sub-directory that did not exist before the run, the root segment
///   is dropped ("<dst>/a/b/c").
///
/// Local destinations get the platform separator. Two items resolving to the
/// same name are not detected here.
[[nodiscard]] auto resolve_destination(const StorageUrl& source,
                                       const StorageUrl& expanded_source,
                                       bool names_container,
                                       bool is_multi_source,
                                       const StorageUrl& destination,
                                       std::optional<bool> destination_had_existing_container)
    -> StorageUrl;

/// Same decision for a NamingShape; fails only when the shape holds an
/// unparsable URL.
[[nodiscard]] auto resolve_destination(const NamingShape& shape,
                                       const StorageUrl& destination)
    -> infra::Result<StorageUrl>;

} // namespace objcp::core
