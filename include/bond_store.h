/**
 * @file bond_store.h
 * @brief Persistence interface for the bonded-device identifier set
 * @version 1.0.0
 *
 * The controller only needs load/save of a set of identifier strings.
 * The nRF52 build persists to internal flash (InternalFsBondStore);
 * MemoryBondStore keeps the set in RAM for hosts without a filesystem.
 */

#ifndef BOND_STORE_H
#define BOND_STORE_H

#include <Arduino.h>
#include <set>
#include <string>

typedef std::set<std::string> BondSet;

class BondStore {
public:
    virtual ~BondStore() = default;

    /**
     * @brief Load the stored identifier set
     * @param out Replaced with the stored set (empty if nothing stored)
     * @return false if the store could not be read
     */
    virtual bool loadIdentifiers(BondSet& out) = 0;

    /**
     * @brief Replace the stored identifier set
     * @return false if the store could not be written
     */
    virtual bool saveIdentifiers(const BondSet& identifiers) = 0;
};

/**
 * @brief RAM-only bond store (lost on reset)
 */
class MemoryBondStore : public BondStore {
public:
    bool loadIdentifiers(BondSet& out) override {
        out = _identifiers;
        return true;
    }

    bool saveIdentifiers(const BondSet& identifiers) override {
        _identifiers = identifiers;
        return true;
    }

private:
    BondSet _identifiers;
};

#endif // BOND_STORE_H
