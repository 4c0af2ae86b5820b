// Process management for the bridge child
// Platform implementation selected at compile time

#ifdef _WIN32
    #include "process_win32.cpp"
#else
    #include "process_posix.cpp"
#endif
