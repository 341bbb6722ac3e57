#include "names.hpp"

#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace analyzer {

const std::unordered_map<std::string_view, NameKind> kNames{
    {"auto", NameKind::kStorage},
    {"break", NameKind::kControl},
    {"case", NameKind::kControl},
    {"char", NameKind::kType},
    {"const", NameKind::kQualifier},
    {"continue", NameKind::kControl},
    {"default", NameKind::kControl},
    {"do", NameKind::kControl},
    {"double", NameKind::kType},
    {"else", NameKind::kControl},
    {"enum", NameKind::kType},
    {"extern", NameKind::kStorage},
    {"float", NameKind::kType},
    {"for", NameKind::kControl},
    {"goto", NameKind::kControl},
    {"if", NameKind::kControl},
    {"inline", NameKind::kStorage},
    {"__inline", NameKind::kStorage},
    {"__inline__", NameKind::kStorage},
    {"int", NameKind::kType},
    {"long", NameKind::kType},
    {"register", NameKind::kStorage},
    {"restrict", NameKind::kQualifier},
    {"__restrict", NameKind::kQualifier},
    {"return", NameKind::kControl},
    {"short", NameKind::kType},
    {"signed", NameKind::kType},
    {"sizeof", NameKind::kOther},
    {"static", NameKind::kStorage},
    {"struct", NameKind::kType},
    {"switch", NameKind::kControl},
    {"typedef", NameKind::kOther},
    {"union", NameKind::kType},
    {"unsigned", NameKind::kType},
    {"void", NameKind::kType},
    {"volatile", NameKind::kQualifier},
    {"while", NameKind::kControl},
    {"_Alignas", NameKind::kOther},
    {"_Alignof", NameKind::kOther},
    {"_Atomic", NameKind::kQualifier},
    {"_Bool", NameKind::kType},
    {"_Complex", NameKind::kType},
    {"_Generic", NameKind::kOther},
    {"_Noreturn", NameKind::kStorage},
    {"_Static_assert", NameKind::kOther},
    {"_Thread_local", NameKind::kStorage},
    {"__attribute__", NameKind::kOther},
    {"__asm__", NameKind::kOther},
    {"asm", NameKind::kOther},
    {"__extension__", NameKind::kOther},
    {"defined", NameKind::kOther},
};

const std::unordered_set<std::string_view> kStandardFunctions{
    // stdio.h
    "printf", "fprintf", "sprintf", "snprintf", "vprintf", "vfprintf",
    "vsprintf", "vsnprintf", "scanf", "fscanf", "sscanf", "puts", "fputs",
    "putchar", "fputc", "putc", "getchar", "fgetc", "getc", "fgets", "fopen",
    "fclose", "fread", "fwrite", "fseek", "ftell", "rewind", "fflush",
    "perror", "remove", "rename", "feof", "ferror", "clearerr", "tmpfile",
    "setvbuf", "ungetc",
    // stdlib.h
    "malloc", "calloc", "realloc", "free", "abort", "exit", "atexit",
    "_Exit", "atoi", "atol", "atoll", "atof", "strtol", "strtoul", "strtoll",
    "strtoull", "strtod", "strtof", "rand", "srand", "qsort", "bsearch",
    "abs", "labs", "llabs", "div", "ldiv", "getenv", "system",
    // string.h
    "memcpy", "memmove", "memset", "memcmp", "memchr", "strlen", "strcpy",
    "strncpy", "strcat", "strncat", "strcmp", "strncmp", "strchr", "strrchr",
    "strstr", "strtok", "strdup", "strndup", "strerror", "strspn", "strcspn",
    "strpbrk", "strcoll", "strxfrm", "strnlen",
    // ctype.h
    "isalpha", "isdigit", "isalnum", "isspace", "isupper", "islower",
    "isxdigit", "ispunct", "isprint", "iscntrl", "isgraph", "toupper",
    "tolower",
    // math.h
    "sqrt", "pow", "fabs", "floor", "ceil", "round", "fmod", "sin", "cos",
    "tan", "asin", "acos", "atan", "atan2", "exp", "log", "log10", "log2",
    "sinf", "cosf", "sqrtf", "powf", "fabsf", "floorf", "ceilf", "roundf",
    "fmin", "fmax", "fminf", "fmaxf", "trunc", "lround", "hypot",
    // time.h, assert.h, setjmp.h, stdarg.h
    "time", "clock", "difftime", "mktime", "localtime", "gmtime", "strftime",
    "assert", "setjmp", "longjmp", "va_start", "va_end", "va_arg", "va_copy",
    // unistd.h and friends commonly seen in embedded code
    "sleep", "usleep", "read", "write", "open", "close",
    // Unity harness
    "UnityBegin", "UnityEnd", "UnityDefaultTestRun", "setUp", "tearDown",
};

const std::unordered_set<std::string_view> kScalarTypeNames{
    "int8_t",    "int16_t",   "int32_t",  "int64_t",   "uint8_t",
    "uint16_t",  "uint32_t",  "uint64_t", "size_t",    "ssize_t",
    "ptrdiff_t", "intptr_t",  "uintptr_t", "bool",     "off_t",
    "time_t",    "wchar_t",   "intmax_t", "uintmax_t", "clock_t",
};

std::optional<NameKind> ParseNameToken(std::string_view value) {
  auto it = kNames.find(value);
  if (it == kNames.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool IsTypeKeyword(std::string_view value) {
  auto kind = ParseNameToken(value);
  return kind.has_value() && *kind == NameKind::kType;
}

bool IsStandardLibraryFunction(std::string_view value) {
  return kStandardFunctions.count(value) != 0;
}

bool IsScalarType(const std::string &type) {
  std::istringstream words(type);
  std::string word;
  bool seen_base = false;
  while (words >> word) {
    auto kind = ParseNameToken(word);
    if (kind == NameKind::kQualifier) {
      continue;
    }
    if (word == "struct" || word == "union" || word == "enum" ||
        word == "void") {
      return false;
    }
    if (kind == NameKind::kType || kScalarTypeNames.count(word) != 0) {
      seen_base = true;
      continue;
    }
    return false;
  }
  return seen_base;
}

} // namespace analyzer
