#pragma once

#include <string>

namespace presence::room
{
// Capture devices behind the camera and microphone toggles. Acquire reports failure
// through the return value; the session then keeps the capability disabled.
class MediaDevices
{
public:
    virtual ~MediaDevices() = default;

    virtual bool AcquireCamera(std::string* outError) = 0;
    virtual void ReleaseCamera() = 0;
    virtual bool AcquireMicrophone(std::string* outError) = 0;
    virtual void ReleaseMicrophone() = 0;
};

// Headless nodes have no capture hardware; acquisition always succeeds and nothing is captured.
class HeadlessMediaDevices final : public MediaDevices
{
public:
    bool AcquireCamera(std::string* /*outError*/) override
    {
        m_cameraHeld = true;
        return true;
    }
    void ReleaseCamera() override { m_cameraHeld = false; }

    bool AcquireMicrophone(std::string* /*outError*/) override
    {
        m_microphoneHeld = true;
        return true;
    }
    void ReleaseMicrophone() override { m_microphoneHeld = false; }

    [[nodiscard]] bool CameraHeld() const { return m_cameraHeld; }
    [[nodiscard]] bool MicrophoneHeld() const { return m_microphoneHeld; }

private:
    bool m_cameraHeld = false;
    bool m_microphoneHeld = false;
};
} // namespace presence::room
