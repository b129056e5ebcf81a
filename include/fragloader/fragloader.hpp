#ifndef FRAGLOADER_API_HPP
#define FRAGLOADER_API_HPP

// Project version
#define FRAGLOADER_VERSION_MAJOR 0
#define FRAGLOADER_VERSION_MINOR 1
#define FRAGLOADER_VERSION_PATCH 0

// Binary version
#define FRAGLOADER_BINARY_CURRENT 0
#define FRAGLOADER_BINARY_REVISION 0
#define FRAGLOADER_BINARY_AGE 0

#include <fragloader/context.hpp>
#include <fragloader/errors.hpp>
#include <fragloader/fragment.hpp>
#include <fragloader/fragment_downloader.hpp>
#include <fragloader/fragment_transport.hpp>
#include <fragloader/progress.hpp>

#endif
