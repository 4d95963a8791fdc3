// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

#include "cli/qcodecli.h"

#include <QCoreApplication>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("qcode");
    QCoreApplication::setApplicationVersion(QCODE_VERSION);

    QCodeCliWorker worker;
    return worker.run(QCoreApplication::arguments());
}
