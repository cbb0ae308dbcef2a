#include <ferris/cpuset.h>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace {

// position right after the next sep, or nullptr
const char* NextToken(const char* str, int sep) {
  if (!str) return nullptr;
  const char* ret = strchr(str, sep);
  return ret ? ret + 1 : nullptr;
}

bool NextNumber(const char* str, char** end, unsigned int& result) {
  if (!str || !isdigit((unsigned char)*str)) return false;
  errno = 0;
  unsigned long val = strtoul(str, end, 10);
  if (errno || str == *end || val > 65535) return false;
  result = val;
  return true;
}

} // namespace

bool CpusetParse(const char* str, cpu_set_t* set, size_t ncpu) {
  CPU_ZERO(set);
  if (strcmp(str, "all") == 0) {
    for (size_t i = 0; i < ncpu && i < CPU_SETSIZE; i++) CPU_SET(i, set);
    return true;
  }
  if (strcmp(str, "none") == 0) return true;

  char* end = nullptr;
  // each item: first[-last[:stride]]
  for (const char *p = str, *next = NextToken(str, ','); p; p = next, next = NextToken(next, ',')) {
    unsigned int first, last, stride = 1;
    if (!NextNumber(p, &end, first)) return false;
    last = first;
    const char* dash = NextToken(end, '-');
    if (dash && (!next || dash < next)) {
      if (!NextNumber(dash, &end, last)) return false;
      const char* colon = *end ? NextToken(end, ':') : nullptr;
      if (colon && (!next || colon < next)) {
        if (!NextNumber(colon, &end, stride) || stride == 0) return false;
      }
    }
    if (first > last) return false;
    // anything else before the next comma is garbage
    if (*end && *end != ',') return false;
    for (unsigned int i = first; i <= last && i < ncpu && i < CPU_SETSIZE; i += stride) CPU_SET(i, set);
  }
  return true;
}
