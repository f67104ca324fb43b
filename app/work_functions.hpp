#pragma once


namespace pwn {

    void work_report(int argc, char* argv[]);

}
