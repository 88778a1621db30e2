// Process dispatcher - includes platform-specific implementation
// Only this file is listed in CMakeLists.txt; the preprocessor selects the
// platform implementation.

#ifdef _WIN32
#include "process_win32.cpp"
#else
#include "process_posix.cpp"
#endif
