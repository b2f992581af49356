#include <QCoreApplication>
#include <QDebug>

#include "src/ready_queue_test.h"
#include "src/task_test.h"
#include "src/unordered_test.h"


int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    int failures = 0;

    qDebug() << "\n" << "task test";
    failures += run_tst_task_api_paranoid(argc, argv);

    qDebug() << "\n" << "ready_queue test";
    failures += run_tst_ready_queue_api_paranoid(argc, argv);

    qDebug() << "\n" << "unordered test";
    failures += run_tst_unordered_api_paranoid(argc, argv);

    if (failures != 0) {
        qWarning() << "fuset tests:" << failures << "failure(s)";
        return 1;
    }

    qInfo() << "fuset tests: all passed";
    return 0;
}
