#pragma once

#ifndef PAGEWATCH_VERSION_STRING
#define PAGEWATCH_VERSION_STRING "0.1.0"
#endif
