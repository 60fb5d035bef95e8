#include "terminal.hpp"
#include <locale.h>

Terminal::Terminal() {
  setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  keypad(stdscr, TRUE);
  set_escdelay(25);
  // View shows the cursor only while a command or search line is edited.
  curs_set(0);
}

// Also runs while a RenderFault unwinds out of Pager::run, so main can print
// the fault to a restored terminal.
Terminal::~Terminal() {
  curs_set(1);
  endwin();
}
