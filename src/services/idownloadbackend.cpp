/**
 * @file idownloadbackend.cpp
 * @brief Translation unit for the IDownloadBackend interface.
 *
 * The interface is header-only; this file gives moc a home for its signals.
 */

#include "idownloadbackend.h"
