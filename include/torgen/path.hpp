#ifndef TORGEN_PATH_HEADER
#define TORGEN_PATH_HEADER

#include <filesystem>

namespace torgen {

namespace fs = std::filesystem;

} // namespace torgen

#endif // TORGEN_PATH_HEADER
