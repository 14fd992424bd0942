#ifndef AUTOMARK_PRIVATE_MAIN_H
#define AUTOMARK_PRIVATE_MAIN_H

#include <automark-pkg/macros.h>

AUTOMARK_PUBLIC void InitLocale();
AUTOMARK_PUBLIC void InitSignals();

#endif
