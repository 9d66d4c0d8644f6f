//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "support/ndebug.h"
#include <ctype.h>
#include <string.h>
namespace ns_pkarr {
//! ----------------------------------------------------------------------------
//! \details: hexdump with offset column and ascii gutter, 16 bytes per row
//! \return:  NA
//! \param:   a_buf bytes to display
//! \param:   a_len length of a_buf
//! ----------------------------------------------------------------------------
void mem_display(const uint8_t* a_buf, size_t a_len) {
  if (!a_buf) {
    return;
  }
  char l_line[256];
  char l_ascii[17];
  size_t l_off = 0;
  while (l_off < a_len) {
    size_t l_line_len = 0;
    l_line_len += snprintf(l_line, sizeof(l_line), "%s0x%08zx %s %s",
                           ANSI_COLOR_FG_BLUE, l_off, ANSI_COLOR_OFF,
                           ANSI_COLOR_FG_GREEN);
    uint32_t l_col = 0;
    for (; l_col < 16; ++l_col) {
      if ((l_off + l_col) < a_len) {
        uint8_t l_b = a_buf[l_off + l_col];
        l_line_len += snprintf(l_line + l_line_len, sizeof(l_line) - l_line_len,
                               "%02x", l_b);
        l_ascii[l_col] = isprint(l_b) ? (char)l_b : '.';
      } else {
        l_line_len += snprintf(l_line + l_line_len, sizeof(l_line) - l_line_len,
                               "..");
        l_ascii[l_col] = '.';
      }
      if (((l_col + 1) % 4) == 0) {
        l_line[l_line_len++] = ' ';
        l_line[l_line_len] = '\0';
      }
    }
    l_ascii[16] = '\0';
    NDBG_OUTPUT("%s%s %s\n", l_line, ANSI_COLOR_OFF, l_ascii);
    l_off += 16;
  }
}
}  // namespace ns_pkarr
