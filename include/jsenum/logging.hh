#ifndef LIBJSENUM_LOGGING_HH
#define LIBJSENUM_LOGGING_HH

#include <glog/logging.h>
#include <glog/stl_logging.h>

#endif // LIBJSENUM_LOGGING_HH
