#ifndef INCLUDE_INVOKER_LOGGER_H_
#define INCLUDE_INVOKER_LOGGER_H_

// Keep the console sink lock consistent across fork().
// Must be called once before any worker thread is started.
void InitLogger();

#endif  // INCLUDE_INVOKER_LOGGER_H_
