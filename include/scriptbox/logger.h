#ifndef INCLUDE_SCRIPTBOX_LOGGER_H_
#define INCLUDE_SCRIPTBOX_LOGGER_H_

// Keeps the console sink lock consistent across fork; call once before any worker thread starts
void InitLogger();

#endif  // INCLUDE_SCRIPTBOX_LOGGER_H_
