#pragma once

#include <QString>

namespace notch {

/// Set the Boost.Log severity threshold from a config string
/// (trace|debug|info|warning|error|fatal). Unknown names fall back to info.
/// The trivial logger's default sink writes to std::clog, so stdout stays
/// free for the MCP transport.
void initLogging(const QString& level);

} // namespace notch
