#include "LanguageDetector.hpp"
#include "Cld2LanguageDetector.hpp"

#include <atomic>
#include <mutex>

#include <plog/Log.h>

namespace processing
{

namespace
{

std::once_flag g_init_flag;
std::atomic<bool> g_initialized{ false };
DetectorSettings g_settings;

const char* backendName(DetectorBackend backend)
{
    switch (backend)
    {
    case DetectorBackend::Cld2:
        return "cld2";
    }
    return "unknown";
}

} // namespace

void DetectorFactory::Initialize(const DetectorSettings& settings)
{
    bool applied = false;
    std::call_once(g_init_flag,
                   [&]()
                   {
                       g_settings = settings;
                       g_initialized.store(true, std::memory_order_release);
                       applied = true;
                   });

    if (applied)
    {
        PLOG_INFO << "Language detector initialized: backend=" << backendName(settings.backend)
                  << " seed=" << settings.seed;
    }
    else if (settings.seed != g_settings.seed || settings.backend != g_settings.backend)
    {
        PLOG_WARNING << "Language detector already initialized (backend=" << backendName(g_settings.backend)
                     << " seed=" << g_settings.seed << "), ignoring new settings";
    }
}

bool DetectorFactory::IsInitialized() noexcept
{
    return g_initialized.load(std::memory_order_acquire);
}

DetectorSettings DetectorFactory::Settings()
{
    Initialize();
    return g_settings;
}

std::unique_ptr<ILanguageDetector> DetectorFactory::Create()
{
    const DetectorSettings settings = Settings();
    switch (settings.backend)
    {
    case DetectorBackend::Cld2:
        return std::make_unique<Cld2LanguageDetector>();
    }
    throw std::logic_error("unsupported language detector backend");
}

} // namespace processing
