#include <QCoreApplication>

#include "CLI/CLI.h"

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("salesanalytics");

    CLI * cli = new CLI();
    if (!cli->start()) {
        delete cli;
        return 1;
    }

    int r = app.exec();
    delete cli;
    return r;
}
