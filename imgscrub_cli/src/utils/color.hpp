//
// Created by Giuseppe Francione on 20/09/25.
//

#ifndef IMGSCRUB_COLOR_HPP
#define IMGSCRUB_COLOR_HPP

// ANSI escapes for stderr messages
#define RESET  "\033[0m"
#define RED    "\033[1;31m"
#define GREEN  "\033[1;32m"
#define YELLOW "\033[1;33m"

#endif // IMGSCRUB_COLOR_HPP
