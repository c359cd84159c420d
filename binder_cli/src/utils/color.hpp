#ifndef BINDER_COLOR_HPP
#define BINDER_COLOR_HPP

// ANSI escape sequences for console output
#define RESET   "\033[0m"
#define RED     "\033[31m"
#define GREEN   "\033[32m"
#define YELLOW  "\033[33m"
#define CYAN    "\033[36m"
#define BOLD    "\033[1m"

#endif // BINDER_COLOR_HPP
