/**
 * @file Collaborators.h
 * @brief Interfaces the control loop drives
 *
 * ControlLoop only talks to hardware, storage and the operator through these.
 * The board build wires in TemperatureSensors, FanDriver, AlertNotifier,
 * TelemetryLog and LittleFsQTableStore; the test suites wire in fakes.
 */

#ifndef COLLABORATORS_H
#define COLLABORATORS_H

#include "ControlTypes.h"
#include "QTable.h"

class Sampler {
  public:
    virtual ~Sampler() {}

    virtual SampleStatus sampleRadiator(TemperatureSample &out) = 0;

    /**
     * @brief Fill `out` with every usable storage probe reading
     * @return number of readings written (0 = storage zone unavailable)
     */
    virtual size_t sampleStorage(StorageReading *out, size_t max) = 0;
};

class Actuator {
  public:
    virtual ~Actuator() {}

    virtual ActuationStatus setSpeed(FanGroup group, int percent) = 0;
};

/**
 * @brief Operator alerts (must not block the control loop)
 */
class NotificationSink {
  public:
    virtual ~NotificationSink() {}

    virtual void notify(const char *subject, const char *message) = 0;
};

class TelemetrySink {
  public:
    virtual ~TelemetrySink() {}

    virtual void record(const CycleTelemetry &row) = 0;
};

class QTableStorage {
  public:
    virtual ~QTableStorage() {}

    /**
     * @brief Replace the contents of `table` with the stored one
     *
     * On NOT_FOUND or CORRUPT the table is left empty.
     */
    virtual PersistStatus load(QTable &table) = 0;
    virtual PersistStatus save(const QTable &table) = 0;
};

/**
 * @brief Bundle of collaborator references handed to ControlLoop
 */
struct ControlPorts {
    Sampler &sampler;
    Actuator &actuator;
    NotificationSink &notifier;
    TelemetrySink &telemetry;
    QTableStorage &storage;
};

#endif // COLLABORATORS_H
