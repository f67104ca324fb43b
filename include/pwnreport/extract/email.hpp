#pragma once

#include <string>
#include <string_view>
#include <vector>


namespace pwn {

    using EmailList = std::vector<std::string>;


    // Every match of `[A-Z0-9._%+-]+@[A-Z0-9.-]+\.[A-Z]{2,}`, case
    // insensitive, in order of appearance. Repeated addresses are kept.
    EmailList find_emails(std::string_view text);

    // Drops repeated addresses, compared case-insensitively. First
    // occurrence wins and keeps its original spelling.
    EmailList dedupe_emails(const EmailList& emails);

}  // namespace pwn
