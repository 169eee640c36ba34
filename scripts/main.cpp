#include "utils.hpp"
#ifdef _WIN32
#include <windows.h>
#endif

int main(int argc, char** argv) {

    #ifdef _WIN32
    SetConsoleOutputCP(65001);//setting the output to utf-8
    #endif

    return Run(argc, argv);
}
