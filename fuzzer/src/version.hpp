#pragma once

#define SQLMUT_VERSION "0.1.0"
