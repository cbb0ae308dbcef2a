#ifndef INCLUDE_FERRIS_LOGGER_H_
#define INCLUDE_FERRIS_LOGGER_H_

// Make the default spdlog logger safe to use across fork(); call once at
// startup after the sinks are configured.
void InitLogger();

#endif  // INCLUDE_FERRIS_LOGGER_H_
