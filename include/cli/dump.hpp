//! # Dump
//!
//! The body of `msgdump`: decodes every top-level MessagePack value in a
//! file and prints each on a line of its own.

#ifndef MSGCODEC_CLI_DUMP_HPP
#define MSGCODEC_CLI_DUMP_HPP

#include <ostream>
#include <string>

namespace msgcodec::cli {

/// Writes the values in the file at `path` to `out`, one per line.
///
/// Returns the process exit status: 0 when the whole file decodes, 1 when it
/// cannot be read or a value fails to decode. Values before the failing one
/// are still written. Errors are logged under module `msgdump`.
auto dump_file(const std::string& path, std::ostream& out) -> int;

} // namespace msgcodec::cli

#endif // MSGCODEC_CLI_DUMP_HPP
