#pragma once

#define GELFMOVER_VERSION "0.3.0"
