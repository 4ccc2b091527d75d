// SPDX-License-Identifier: Apache-2.0
#include <glassterm/Config.h>
#include <glassterm/QtScheduler.h>

#include <vtlayout/LayoutGeometry.h>
#include <vtlayout/MockHost.h>
#include <vtlayout/ViewportController.h>

#include <crispy/logstore.h>

#include <fmt/format.h>

#include <QtCore/QCoreApplication>
#include <QtCore/QStringList>
#include <QtCore/QTimer>

#include <chrono>
#include <cstdlib>
#include <exception>
#include <memory>
#include <optional>

using namespace std::chrono_literals;

using vtlayout::ColumnCount;
using vtlayout::LineCount;
using vtlayout::PageSize;

namespace
{

auto const inline demoLog = logstore::category("glassterm.demo", "Logs the headless resize demo.");

// Title bar of 28 pixels on a window of the given height.
vtlayout::ChromeContext titleBarContext(double windowHeight, int tabCount)
{
    return vtlayout::ChromeContext { .windowContentHeight = windowHeight,
                                     .contentLayoutHeight = windowHeight - 28.0,
                                     .tabCount = tabCount };
}

struct Options
{
    std::optional<std::string> configFile;
    std::chrono::milliseconds duration = 5s;
};

Options parseArguments(QStringList const& arguments)
{
    auto options = Options {};
    if (arguments.size() > 1 && !arguments.at(1).isEmpty())
        options.configFile = arguments.at(1).toStdString();
    if (arguments.size() > 2)
    {
        auto ok = false;
        auto const seconds = arguments.at(2).toDouble(&ok);
        if (ok && seconds > 0)
            options.duration = std::chrono::milliseconds(static_cast<long long>(seconds * 1000));
        else
            logstore::errorLog()("Ignoring invalid duration {}.", arguments.at(2).toStdString());
    }
    return options;
}

int runDemo(QCoreApplication& app)
{
    auto const options = parseArguments(QCoreApplication::arguments());

    auto config = glassterm::config::Config {};
    if (options.configFile)
        glassterm::config::loadConfigFromFile(config, *options.configFile);

    glassterm::config::applyLogging(config);
    if (char const* logFilterString = std::getenv("LOG"); logFilterString)
        logstore::configure(logFilterString);
    logstore::enable_console_output();

    auto scheduler = glassterm::QtScheduler {};
    auto engine = vtlayout::MockGridEngine { PageSize { LineCount(25), ColumnCount(80) }, config.font };

    auto const insets = vtlayout::makeChromeInsets(32.0, config.layout.padding);
    auto const windowSize =
        vtlayout::computeWindowSize(engine.optimalPixelSize(engine.pageSize()), insets);
    auto window = vtlayout::MockWindowHost { vtlayout::Rect { 200, 200, windowSize.width, windowSize.height },
                                             titleBarContext(windowSize.height, 1) };

    auto controller = std::make_unique<vtlayout::ViewportController>(engine, &window, scheduler, config.layout);

    // Toolkits report frame changes synchronously from within setFrame().
    window.frameChanged = [&](vtlayout::Rect const& frame) {
        window.context = titleBarContext(frame.height, window.context ? window.context->tabCount : 1);
        controller->onWindowFrameChanged();
    };

    auto scrollbar = vtlayout::MockScrollbar {};
    auto indicator = vtlayout::MockIndicatorView {};
    controller->attachScrollIndicator(scrollbar, indicator);

    controller->resizeTo(PageSize { LineCount(25), ColumnCount(80) });
    controller->toggleOscillator(vtlayout::ResizeOscillator::Direction::Growing);

    // Open a second tab half way through, and close it again shortly after.
    QTimer::singleShot(static_cast<int>(options.duration.count() / 2), [&]() {
        demoLog()("Opening a second tab.");
        window.context->tabCount = 2;
        controller->onChromeContextChanged();
        controller->onScrollInput(true);
    });
    QTimer::singleShot(static_cast<int>(options.duration.count() * 3 / 4), [&]() {
        demoLog()("Closing the second tab.");
        window.context->tabCount = 1;
        controller->onTabClosed();
    });

    QTimer::singleShot(static_cast<int>(options.duration.count()), [&]() {
        controller->setOscillatorDirection(vtlayout::ResizeOscillator::Direction::Idle);
        fmt::print("Oscillator ticks: {}\n", controller->oscillator().tickCount());
        fmt::print("Grid size: {}\n", engine.pageSize());
        fmt::print("Window frame: {}\n", window.frame());
        fmt::print("Chrome insets: {}\n", controller->coordinator().lastKnownInsets());
        app.quit();
    });

    auto const result = QCoreApplication::exec();

    // Destroy the controller (and its pending timers) before the scheduler goes away.
    window.frameChanged = {};
    controller.reset();
    return result;
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("glassterm");

    try
    {
        return runDemo(app);
    }
    catch (std::exception const& e)
    {
        logstore::errorLog()("Unhandled error caught. {}", e.what());
        return EXIT_FAILURE;
    }
}
