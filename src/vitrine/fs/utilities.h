#ifndef VITRINE_FS_UTILITIES_H
#define VITRINE_FS_UTILITIES_H

#include <vitrine/fs/types.hpp>

namespace vitrine {

// Remove :dir (and everything in it) if it exists and then recreate it as an
// empty directory.
void
reset_directory(file_path const& dir);

} // namespace vitrine

#endif
