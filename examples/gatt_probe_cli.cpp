/*
 * Author: Sven Gothel <sgothel@jausoft.com>
 * Copyright (c) 2022 Gothel Software e.K.
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject to
 * the following conditions:
 *
 * The above copyright notice and this permission notice shall be
 * included in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
 * NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE
 * LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION
 * OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION
 * WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>
#include <cstdio>
#include <cinttypes>
#include <cstdlib>
#include <optional>

#include <jau/debug.hpp>
#include <jau/basic_types.hpp>
#include <jau/fraction_type.hpp>

#include <gatt_probe/ProbeEnv.hpp>
#include <gatt_probe/ValueCodec.hpp>
#include <gatt_probe/SessionCoordinator.hpp>
#include <gatt_probe/DBTDeviceGateway.hpp>

extern "C" {
    #include <unistd.h>
}

/** \file
 * This _gatt_probe_cli_ example drives one inspection session on the console:
 * - scan for devices and print them by signal strength
 * - connect to the given or strongest device and print its attribute tree
 * - read all readable characteristics, optionally write one
 * - subscribe to all notifiable characteristics for a while and print their value log
 *
 * The main thread is the session thread, all notification and disconnect events are applied here.
 */

using namespace gatt_probe;
using namespace jau::fractions_i64_literals;

static std::string mac_addr;
static std::string char_filter;
static std::optional<std::string> write_input;
static bool write_hex = true;
static bool write_with_response = true;
static jau::fraction_i64 notify_time = 10_s;
static bool QUIET = false;

static void print_status(const SessionCoordinator& coord) {
    fprintf(stdout, "%s\n", coord.getStatusLine().c_str());
}

static bool matches_filter(const AttributeInfo& a) {
    return char_filter.empty() || std::string::npos != a.id.find(char_filter);
}

static void print_devices(const SessionState& state) {
    const jau::darray<DeviceRecord>& devices = state.getDevices();
    fprintf(stdout, "Devices: %zu\n", (size_t)devices.size());
    for(size_t i=0; i<devices.size(); ++i) {
        const DeviceRecord& d = devices[i];
        fprintf(stdout, "  [%02zu] %-17s %4d dBm  %s\n", i, d.address.c_str(), d.signal_strength,
                d.name.empty() ? "<unknown>" : d.name.c_str());
    }
}

static void print_tree(const SessionState& state) {
    for(const ServiceInfo& s : state.getServices()) {
        fprintf(stdout, "Service %s\n", s.id.c_str());
        for(const AttributeInfo& a : s.attributes) {
            fprintf(stdout, "  %s%s%s\n", format_attribute_label(a, state.isSubscribed(a.key)).c_str(),
                    a.description.empty() ? "" : "  ", a.description.c_str());
        }
    }
}

static void print_logs(const SessionCoordinator& coord) {
    const SessionState& state = coord.getState();
    for(const ServiceInfo& s : state.getServices()) {
        for(const AttributeInfo& a : s.attributes) {
            const LogRing* log = state.getLog(a.key);
            if( nullptr == log || log->isEmpty() ) {
                continue;
            }
            fprintf(stdout, "Log %s: %u entries\n", a.key.c_str(), (unsigned int)log->size());
            if( !QUIET ) {
                for(const ValueEntry& e : log->getEntries()) {
                    fprintf(stdout, "  %s\n", format_log_line(e).c_str());
                }
            }
            fprintf(stdout, "Latest %s\n%s\n\n", a.id.c_str(), coord.getLatestView(a.key).c_str());
        }
    }
}

static int run_session(SessionCoordinator& coord) {
    const SessionState& state = coord.getState();

    OperationResult res = coord.scan();
    print_status(coord);
    if( !res.isSuccess() ) {
        return 1;
    }
    print_devices(state);

    std::string address = mac_addr;
    if( address.empty() ) {
        if( 0 == state.getDevices().size() ) {
            jau::fprintf_td(stderr, "No device found\n");
            return 1;
        }
        address = state.getDevices()[0].address;
    }
    res = coord.connect(address);
    print_status(coord);
    if( !res.isSuccess() ) {
        return 1;
    }
    print_tree(state);

    // an unsolicited disconnect clears the attribute tree, iterate over copied keys
    jau::darray<std::string> readable, writable, notifiable;
    for(const ServiceInfo& s : state.getServices()) {
        for(const AttributeInfo& a : s.attributes) {
            if( !matches_filter(a) ) {
                continue;
            }
            if( a.isReadable() ) {
                readable.push_back(a.key);
            }
            if( a.isWritable() || a.isWritableNoResp() ) {
                writable.push_back(a.key);
            }
            if( a.isNotifiable() ) {
                notifiable.push_back(a.key);
            }
        }
    }
    for(const std::string& key : readable) {
        coord.select(key);
        coord.read(key);
        print_status(coord);
        coord.processEvents();
    }
    if( write_input.has_value() ) {
        if( 0 == writable.size() ) {
            jau::fprintf_td(stderr, "No writable characteristic for value '%s'\n", write_input.value().c_str());
        }
        for(const std::string& key : writable) {
            coord.select(key);
            const OperationResult wres = coord.writeInput(key, write_input.value(), write_hex, write_with_response);
            print_status(coord);
            if( ProbeStatusCode::INVALID_INPUT == wres.status ) {
                break;
            }
        }
    }
    for(const std::string& key : notifiable) {
        coord.select(key);
        coord.toggleNotify(key);
        print_status(coord);
    }
    if( 0 < notifiable.size() ) {
        const jau::fraction_timespec t_end = jau::getMonotonicTime() + jau::fraction_timespec(notify_time);
        std::string last_status;
        while( coord.isConnected() && jau::getMonotonicTime() < t_end ) {
            coord.processEvents(100_ms);
            const std::string status = coord.getStatusLine();
            if( !QUIET && status != last_status ) {
                fprintf(stdout, "%s\n", status.c_str());
                last_status = status;
            }
        }
        for(const std::string& key : notifiable) {
            if( coord.isConnected() && state.isSubscribed(key) ) {
                coord.toggleNotify(key);
            }
        }
        coord.processEvents();
    }
    print_logs(coord);

    coord.disconnect();
    print_status(coord);
    return 0;
}

int main(int argc, char *argv[])
{
    int dev_id = -1;
    int64_t scan_timeout_ms = -1;
    int64_t connect_timeout_ms = -1;

    for(int i=1; i<argc; i++) {
        fprintf(stderr, "arg[%d/%d]: '%s'\n", i, argc, argv[i]);

        if( !strcmp("-debug", argv[i]) && argc > (i+1) ) {
            setenv("jau.debug", argv[++i], 1 /* overwrite */);
        } else if( !strcmp("-verbose", argv[i]) && argc > (i+1) ) {
            setenv("jau.verbose", argv[++i], 1 /* overwrite */);
        } else if( !strcmp("-gp_handoff", argv[i]) && argc > (i+1) ) {
            setenv("gatt_probe.debug.handoff", argv[++i], 1 /* overwrite */);
        } else if( !strcmp("-gp_errlog", argv[i]) && argc > (i+1) ) {
            setenv("gatt_probe.error.log", argv[++i], 1 /* overwrite */);
        } else if( !strcmp("-dbt_debug", argv[i]) && argc > (i+1) ) {
            setenv("direct_bt.debug", argv[++i], 1 /* overwrite */);
        } else if( !strcmp("-dbt_verbose", argv[i]) && argc > (i+1) ) {
            setenv("direct_bt.verbose", argv[++i], 1 /* overwrite */);
        } else if( !strcmp("-dev", argv[i]) && argc > (i+1) ) {
            dev_id = atoi(argv[++i]);
        } else if( !strcmp("-mac", argv[i]) && argc > (i+1) ) {
            mac_addr = std::string(argv[++i]);
        } else if( !strcmp("-char", argv[i]) && argc > (i+1) ) {
            char_filter = std::string(argv[++i]);
        } else if( !strcmp("-write", argv[i]) && argc > (i+1) ) {
            const std::string v(argv[++i]);
            write_hex = 0 != v.compare(0, 5, "text:");
            write_input = write_hex ? v : v.substr(5);
        } else if( !strcmp("-noresp", argv[i]) ) {
            write_with_response = false;
        } else if( !strcmp("-scan_timeout", argv[i]) && argc > (i+1) ) {
            scan_timeout_ms = atoi(argv[++i]);
        } else if( !strcmp("-connect_timeout", argv[i]) && argc > (i+1) ) {
            connect_timeout_ms = atoi(argv[++i]);
        } else if( !strcmp("-notify_time", argv[i]) && argc > (i+1) ) {
            notify_time = jau::fraction_i64( atoi(argv[++i]), 1'000lu );
        } else if( !strcmp("-quiet", argv[i]) ) {
            QUIET = true;
        }
    }
    jau::fprintf_td(stderr, "pid %d\n", getpid());

    jau::fprintf_td(stderr, "Run with '[-dev <adapter_dev_id>] [-mac <device_address>] [-char <uuid_sub>] "
                    "[-write <hex>|text:<text>] [-noresp] "
                    "[-scan_timeout <ms>] [-connect_timeout <ms>] [-notify_time <ms>] [-quiet] "
                    "[-gp_errlog <path>] [-gp_handoff true|false] "
                    "[-debug true|false] [-verbose true|false] "
                    "[-dbt_debug true|false|adapter.event,gatt.data,hci.event,hci.scan_ad_eir,mgmt.event] "
                    "[-dbt_verbose true|false]'\n");

    const ProbeEnv& env = ProbeEnv::get();
    jau::fprintf_td(stderr, "dev_id %d\n", dev_id);
    jau::fprintf_td(stderr, "mac %s\n", mac_addr.empty() ? "strongest" : mac_addr.c_str());
    jau::fprintf_td(stderr, "char %s\n", char_filter.empty() ? "all" : char_filter.c_str());
    jau::fprintf_td(stderr, "write '%s', hex %d, with_response %d\n",
            write_input.has_value() ? write_input.value().c_str() : "n/a", write_hex, write_with_response);
    jau::fprintf_td(stderr, "notify_time %" PRIi64 " ms\n", notify_time.to_ms());
    jau::fprintf_td(stderr, "error log %s\n", env.ERROR_LOG_PATH.c_str());

    SessionContext ctx( static_cast<jau::nsize_t>(env.SESSION_RING_CAPACITY) );
    SessionState state( static_cast<jau::nsize_t>(env.LOG_MAX) );
    DiagnosticSink sink(env.ERROR_LOG_PATH);

    std::string detail;
    std::shared_ptr<direct_bt::BTAdapter> adapter = DBTDeviceGateway::chooseAdapter(dev_id, detail);
    if( nullptr == adapter ) {
        sink.record("adapter", detail);
        fprintf(stdout, "%s\n", format_error("Adapter", detail, get_platform_type(), sink.getPath()).c_str());
        return 1;
    }
    int res;
    {
        DBTDeviceGateway gateway(adapter);
        SessionCoordinator coord(gateway, state, ctx, sink);
        if( 0 < scan_timeout_ms ) {
            coord.setScanTimeout( jau::fraction_i64(scan_timeout_ms, 1'000lu) );
        }
        if( 0 < connect_timeout_ms ) {
            coord.setConnectTimeout( jau::fraction_i64(connect_timeout_ms, 1'000lu) );
        }
        jau::fprintf_td(stderr, "****** SESSION start: %s\n", coord.toString().c_str());
        res = run_session(coord);
        jau::fprintf_td(stderr, "****** SESSION end: %s\n", coord.toString().c_str());
    }
    ctx.close();
    return res;
}
