#include "app/DaemonMain.hpp"

int main(int argc, char *argv[])
{
    return ts::app::daemon_main(argc, argv);
}
