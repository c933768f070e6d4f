#ifndef _CodeAssist_CodeAssist_h_
#define _CodeAssist_CodeAssist_h_

// Standard library includes
#include <cstdint>
#include <cstring>
#include <cstdlib>
#include <cstdio>
#include <cctype>
#include <cstddef>
#include <cerrno>
#include <cmath>
#include <algorithm>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>
#include <fstream>
#include <filesystem>
#include <iomanip>
#include <limits>
#include <exception>

// System includes
#include <termios.h>
#include <unistd.h>

#include "trace.h"
#include "fault.h"
#include "config.h"
#include "value.h"
#include "ops.h"
#include "format.h"
#include "lexer.h"
#include "ast.h"
#include "parser.h"
#include "builtins.h"
#include "methods.h"
#include "interpreter.h"
#include "sandbox.h"
#include "utils.h"
#include "line_editor.h"


#endif
