#include <config.h>

#include <automark-private/private-main.h>

#include <clocale>
#include <locale>
#include <stdexcept>

#include <signal.h>

#include <automarki18n.h>

void InitLocale()							/*{{{*/
{
   try {
      std::locale::global(std::locale(""));
   } catch (std::runtime_error const &) {
      setlocale(LC_ALL, "");
   }
#ifdef USE_NLS
   textdomain(AUTOMARK_DOMAIN);
#endif
}
									/*}}}*/
void InitSignals()							/*{{{*/
{
   signal(SIGPIPE,SIG_IGN);
}
									/*}}}*/
