#pragma once

#include "tgstats/archive/v1/telegram_export.pb.h"
