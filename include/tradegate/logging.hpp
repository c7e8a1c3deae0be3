#ifndef TRADEGATE_LOGGING_HPP
#define TRADEGATE_LOGGING_HPP

#include <string>

namespace tradegate {

// Installs a colored stdout logger named "tradegate" as the spdlog default.
// Accepts debug, info, warn and error; unknown levels fall back to info.
void setup_logging(const std::string& level);

} // namespace tradegate

#endif // TRADEGATE_LOGGING_HPP
