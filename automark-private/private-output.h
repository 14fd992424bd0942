#ifndef AUTOMARK_PRIVATE_OUTPUT_H
#define AUTOMARK_PRIVATE_OUTPUT_H

#include <automark-pkg/configuration.h>
#include <automark-pkg/macros.h>

#include <fstream>
#include <iostream>
#include <string>
#include <vector>

AUTOMARK_PUBLIC extern std::ostream c0out;
AUTOMARK_PUBLIC extern std::ostream c1out;
AUTOMARK_PUBLIC extern std::ofstream devnull;
AUTOMARK_PUBLIC extern unsigned int ScreenWidth;

AUTOMARK_PUBLIC bool InitOutput(std::basic_streambuf<char> * const out = std::cout.rdbuf());

/** \brief escape sequence configured for the given color or role
 *
 * Roles like "action::auto" name a color like "green" which is looked
 * up again, so both can be changed in the configuration. */
AUTOMARK_PUBLIC std::string OutputColor(std::string const &Name);

AUTOMARK_PUBLIC void ShowWithColumns(std::ostream &out, const std::vector<std::string> &List, size_t Indent, size_t ScreenWidth);

/** \brief print a title followed by the names in cont
 *
 * Nothing is printed for an empty container.
 * \return true if nothing was printed */
template<class Container> bool ShowList(std::ostream &out, std::string const &Title,
      Container const &cont, std::string const &colorName = "")
{
   if (cont.empty() == true)
      return true;

   size_t const ScreenWidth = (::ScreenWidth > 3) ? ::ScreenWidth - 3 : 0;
   bool const ListColumns = _config->FindB("Automark::Output::Columns", false);
   std::string const setColor = OutputColor(colorName);
   std::string const resetColor = setColor.empty() ? "" : OutputColor("neutral");

   out << Title << std::endl;
   if (ListColumns == true)
   {
      out << setColor;
      ShowWithColumns(out, std::vector<std::string>(cont.begin(), cont.end()), 2, ScreenWidth);
      out << resetColor;
      return false;
   }

   size_t ScreenUsed = 0;
   for (std::string const &Name : cont)
   {
      if (ScreenUsed == 0 || (ScreenUsed + Name.length()) >= ScreenWidth)
      {
	 if (ScreenUsed != 0)
	    out << std::endl;
	 out << "  ";
	 ScreenUsed = 0;
      }
      else
      {
	 out << " ";
	 ++ScreenUsed;
      }
      out << setColor << Name << resetColor;
      ScreenUsed += Name.length();
   }
   out << std::endl;
   return false;
}

#endif
