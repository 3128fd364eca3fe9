// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The termcolor Authors

#include "configuration.h"

#include "../color/ColorErrors.h"
#include "../global/logging.h"

#include <atomic>
#include <cassert>
#include <mutex>
#include <optional>
#include <string_view>
#include <stdexcept>
#include <thread>

#include <QByteArray>
#include <QFile>
#include <QFileInfo>

namespace { // anonymous

std::thread::id g_thread{};
std::atomic_bool g_config_enteredMain{false};

NODISCARD QString toQString(const std::string_view sv)
{
    return QString::fromUtf8(sv.data(), static_cast<int>(sv.size()));
}

} // namespace

#define ConstString static constexpr const char *const
ConstString SETTINGS_ORGANIZATION = "termcolor";
ConstString SETTINGS_APPLICATION = "termcolor";

class NODISCARD Settings final
{
private:
    static constexpr const char *const TERMCOLOR_PROFILE_PATH = "TERMCOLOR_PROFILE_PATH";

private:
    std::optional<QSettings> m_settings;

private:
    NODISCARD static bool isValid(const QString &fileName)
    {
        const QFileInfo info{fileName};
        return !info.isDir() && info.exists() && info.isReadable() && info.isWritable();
    }

private:
    void initSettings();

public:
    DELETE_CTORS_AND_ASSIGN_OPS(Settings);
    Settings() { initSettings(); }
    ~Settings() = default;
    explicit operator QSettings &()
    {
        if (!m_settings) {
            throw std::runtime_error("object does not exist");
        }
        return m_settings.value();
    }
};

void Settings::initSettings()
{
    if (m_settings) {
        throw std::runtime_error("object already exists");
    }

    static std::mutex g_mutex;
    std::lock_guard<std::mutex> lock{g_mutex};

    static auto g_path = qgetenv(TERMCOLOR_PROFILE_PATH);

    if (!g_path.isEmpty()) {
        const QString pathString = QString::fromLocal8Bit(g_path);

        static std::once_flag attempt_flag;
        std::call_once(attempt_flag, [&pathString] {
            TCLOG_INFO() << "Attempting to use settings from " << pathString
                         << " (specified by environment variable " << TERMCOLOR_PROFILE_PATH
                         << ")...";
        });

        if (!isValid(pathString)) {
            TCLOG_WARNING() << "Falling back to default settings path because " << pathString
                            << " is not a writable file.";
            g_path.clear();
        } else {
            m_settings.emplace(pathString, QSettings::IniFormat);
        }
    }

    if (!m_settings) {
        m_settings.emplace(SETTINGS_ORGANIZATION, SETTINGS_APPLICATION);
    }

    static std::once_flag success_flag;
    std::call_once(success_flag, [this] {
        auto &&info = TCLOG_INFO();
        info << "Using settings from " << static_cast<QSettings &>(*this).fileName();
        if (g_path.isEmpty()) {
            info << " (Hint: Environment variable " << TERMCOLOR_PROFILE_PATH
                 << " overrides the default).";
        } else {
            info << ".";
        }
    });
}

#define SETTINGS(conf) \
    Settings settings; \
    QSettings &conf = static_cast<QSettings &>(settings)

ConstString GRP_COLOR = "Color";

ConstString KEY_OUTPUT_PALETTE = "outputPalette";
ConstString KEY_DISTANCE_METRIC = "distanceMetric";
ConstString KEY_USE_APPROXIMATION_CACHE = "useApproximationCache";
ConstString KEY_PREFER_RGB = "preferRgb";

#define GROUP_CALLBACK(callback, name, ref) \
    do { \
        conf.beginGroup(name); \
        ref.callback(conf); \
        conf.endGroup(); \
    } while (false)

void Configuration::readFrom(QSettings &conf)
{
    GROUP_CALLBACK(read, GRP_COLOR, colorSettings);
}

void Configuration::writeTo(QSettings &conf) const
{
    GROUP_CALLBACK(write, GRP_COLOR, colorSettings);
}

#undef GROUP_CALLBACK

void Configuration::read()
{
    SETTINGS(conf);
    readFrom(conf);
}

void Configuration::write() const
{
    SETTINGS(conf);
    writeTo(conf);
}

void Configuration::reset()
{
    {
        SETTINGS(conf);
        conf.clear();
    }

    *this = Configuration{};
    read();
}

void Configuration::ColorSettings::read(const QSettings &conf)
{
    const ColorSettings defaults;

    const QString paletteName = conf.value(KEY_OUTPUT_PALETTE, toQString(getName(defaults.outputPalette)))
                                    .toString();
    if (const auto palette = parseOutputPalette(paletteName.toStdString())) {
        outputPalette = *palette;
    } else {
        TCLOG_WARNING() << "invalid " << KEY_OUTPUT_PALETTE << ": " << paletteName
                        << "; using " << getName(defaults.outputPalette);
        outputPalette = defaults.outputPalette;
    }

    const QString metricName = conf.value(KEY_DISTANCE_METRIC,
                                          toQString(getName(defaults.distanceMetric)))
                                   .toString();
    try {
        distanceMetric = parseDistanceMetric(metricName.toStdString());
    } catch (const UnknownMetricError &ex) {
        TCLOG_WARNING() << "invalid " << KEY_DISTANCE_METRIC << ": " << ex.what() << "; using "
                        << getName(defaults.distanceMetric);
        distanceMetric = defaults.distanceMetric;
    }

    useApproximationCache = conf.value(KEY_USE_APPROXIMATION_CACHE, defaults.useApproximationCache)
                                .toBool();
    preferRgb = conf.value(KEY_PREFER_RGB, defaults.preferRgb).toBool();
}

void Configuration::ColorSettings::write(QSettings &conf) const
{
    conf.setValue(KEY_OUTPUT_PALETTE, toQString(getName(outputPalette)));
    conf.setValue(KEY_DISTANCE_METRIC, toQString(getName(distanceMetric)));
    conf.setValue(KEY_USE_APPROXIMATION_CACHE, useApproximationCache);
    conf.setValue(KEY_PREFER_RGB, preferRgb);
}

ResolverOptions Configuration::ColorSettings::getResolverOptions() const
{
    ResolverOptions options;
    options.metric = distanceMetric;
    options.useCache = useApproximationCache;
    options.preferRgb = preferRgb;
    return options;
}

Configuration &setConfig()
{
    assert(g_config_enteredMain);
    assert(g_thread == std::this_thread::get_id());
    static Configuration conf = []() {
        Configuration tmp;
        tmp.read();
        return tmp;
    }();
    return conf;
}

const Configuration &getConfig()
{
    return setConfig();
}

void setEnteredMain()
{
    g_thread = std::this_thread::get_id();
    g_config_enteredMain = true;
}
