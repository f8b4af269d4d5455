#pragma once

#define PLEDGE_VERSION_MAJOR 0
#define PLEDGE_VERSION_MINOR 3
#define PLEDGE_VERSION_PATCH 0

#define PLEDGE_VERSION \
  (PLEDGE_VERSION_MAJOR * 10000 + PLEDGE_VERSION_MINOR * 100 + PLEDGE_VERSION_PATCH)
