#ifndef MSG_HPP
#define MSG_HPP

#include <string>


/**
 * @brief Basic functions for outputting errors, warnings and info lines to the screen
 * 
 */
namespace Msg {
   [[noreturn]] void error(std::string s);   // Output an error to the screen (exits the program)
   void   warning(std::string s);            // Output a warning to the screen
   void   info(std::string s);               // Output an informational line to the screen
}

#endif
