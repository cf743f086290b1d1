#include "config.h"
#include "study_config.h"
#include "job_structures.h"
#include "convergence_analysis.h"
#include <algorithm>
#include <chrono>
#include <deque>
#include <map>
#include <unordered_set>
#include <utility>

using namespace caf;

// CAF serialization support for study_job_t
template <class Inspector>
bool inspect(Inspector& f, study_job_t& x) {
    return f.object(x).fields(
        f.field("family", x.family),
        f.field("order", x.order),
        f.field("m", x.m),
        f.field("L", x.L),
        f.field("dissipation", x.dissipation)
    );
}

CAF_BEGIN_TYPE_ID_BLOCK(sbp_convergence, caf::first_custom_type_id)
    CAF_ADD_TYPE_ID(sbp_convergence, (study_job_t))
CAF_END_TYPE_ID_BLOCK(sbp_convergence)

/*
==================================================================================================================
WORKER
====================================================================================================================
*/

struct worker_state {
    actor manager_actor;
};

behavior worker_actor(stateful_actor<worker_state>* self, actor manager) {
    self->state().manager_actor = manager;

    return {
        [=](study_job_t job) {
            auto start_time = std::chrono::high_resolution_clock::now();
            try {
                sbp::ConvergenceAnalysis analysis(job.L);
                double error = analysis.measure_error(sbp::parse_family(job.family), job.order,
                                                      job.m, job.dissipation);

                auto end_time = std::chrono::high_resolution_clock::now();
                auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
                double runtime_sec = duration.count() / 1000.0;

                anon_mail("result", job, error, runtime_sec, actor{self}).send(self->state().manager_actor);
            } catch (const std::exception& e) {
                anon_mail("failed", job, std::string(e.what()), actor{self}).send(self->state().manager_actor);
            }
        },
        [=](const std::string& msg) {
            if (msg == "quit") {
                anon_mail("quit", actor{self}).send(self->state().manager_actor);
                self->quit();
            }
        }
    };
}

/*
==================================================================================================================
SERVER
====================================================================================================================
*/

struct server_state {
    study_config conf;
    std::deque<study_job_t> pending_jobs;
    std::unordered_set<actor> active_workers;
    int active_jobs = 0;
    int total_jobs_completed = 0;
    int total_jobs_failed = 0;
    bool termination_initiated = false;
    // Completed levels and failure flag per order
    std::map<int, std::vector<result_entry>> series;
    std::map<int, bool> series_failed;
    std::chrono::high_resolution_clock::time_point start_time;
};

void create_jobs(stateful_actor<server_state>* self) {
    const study_config& conf = self->state().conf;
    for (int order : conf.orders) {
        for (int m : conf.grid_sizes) {
            self->state().pending_jobs.emplace_back(conf.family, order, m, conf.L, conf.dissipation);
        }
        self->state().series_failed[order] = false;
    }
    self->println("Created {} jobs for {} orders x {} grid levels",
                  self->state().pending_jobs.size(), conf.orders.size(), conf.grid_sizes.size());
}

void dispatch_next(stateful_actor<server_state>* self, const actor& worker) {
    if (self->state().termination_initiated) {
        return;
    }
    if (!self->state().pending_jobs.empty()) {
        study_job_t job = self->state().pending_jobs.front();
        self->state().pending_jobs.pop_front();
        ++self->state().active_jobs;
        self->mail(std::move(job)).send(worker);
    }
}

void report_series(stateful_actor<server_state>* self, int order) {
    auto& entries = self->state().series[order];
    std::sort(entries.begin(), entries.end(),
              [](const result_entry& a, const result_entry& b) { return a.m < b.m; });

    std::vector<double> h, err;
    for (const auto& entry : entries) {
        h.push_back(entry.h);
        err.push_back(entry.error);
    }

    self->println("=== {} order {}{} ===", self->state().conf.family, order,
                  self->state().conf.dissipation ? " (dissipation)" : "");

    std::vector<double> rates = sbp::ConvergenceAnalysis::pairwise_orders(h, err);
    for (size_t i = 0; i < entries.size(); ++i) {
        if (i == 0) {
            self->println(" m={} h={:.6e} error={:.6e}", entries[i].m, entries[i].h, entries[i].error);
        } else {
            self->println(" m={} h={:.6e} error={:.6e} rate={:.3f}",
                          entries[i].m, entries[i].h, entries[i].error, rates[i - 1]);
        }
    }

    try {
        double fitted = sbp::ConvergenceAnalysis::observed_order(h, err);
        self->println(" fitted order: {:.3f}", fitted);
    } catch (const std::exception& e) {
        self->println(" fitted order unavailable: {}", e.what());
    }
}

void check_termination(stateful_actor<server_state>* self) {
    if (self->state().termination_initiated) {
        return;
    }
    if (!self->state().pending_jobs.empty() || self->state().active_jobs != 0) {
        return;
    }

    self->println("=== STUDY COMPLETE: No pending jobs and no active jobs ===");
    self->println("Final statistics:");
    self->println(" Jobs completed: {}", self->state().total_jobs_completed);
    self->println(" Jobs failed: {}", self->state().total_jobs_failed);

    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - self->state().start_time);
    self->println("Total runtime: {} ms", duration.count());

    for (const auto& worker : self->state().active_workers) {
        anon_mail("quit").send(worker);
    }
    self->state().termination_initiated = true;
}

behavior server(stateful_actor<server_state>* self, study_config conf) {
    self->state().conf = std::move(conf);
    self->state().start_time = std::chrono::high_resolution_clock::now();

    create_jobs(self);

    for (int i = 0; i < self->state().conf.actor_number; ++i) {
        auto worker = self->spawn(worker_actor, actor{self});
        self->state().active_workers.insert(worker);
        dispatch_next(self, worker);
    }
    check_termination(self);

    return {
        [=](const std::string& msg, study_job_t job, double error, double runtime_sec, actor worker) {
            if (msg != "result") return;

            --self->state().active_jobs;
            ++self->state().total_jobs_completed;

            double h = sbp::family_spacing(sbp::parse_family(job.family), job.m, job.L);
            self->state().series[job.order].emplace_back(job.m, h, error);

            self->println("Job completed: order={}, m={}, error={:.6e}, runtime={:.3f}s",
                          job.order, job.m, error, runtime_sec);

            if (self->state().series[job.order].size() == self->state().conf.grid_sizes.size()
                && !self->state().series_failed[job.order]) {
                report_series(self, job.order);
            }

            dispatch_next(self, worker);
            check_termination(self);
        },

        [=](const std::string& msg, study_job_t job, const std::string& what, actor worker) {
            if (msg != "failed") return;

            --self->state().active_jobs;
            ++self->state().total_jobs_failed;
            self->state().series_failed[job.order] = true;

            self->println("JOB FAILED: order={}, m={}: {}", job.order, job.m, what);

            dispatch_next(self, worker);
            check_termination(self);
        },

        [=](const std::string& msg, actor worker) {
            if (msg == "quit") {
                self->state().active_workers.erase(worker);

                if (self->state().active_workers.empty()) {
                    self->println("All workers have quit. Terminating server...");
                    self->quit();
                }
            }
        }
    };
}

/*
==================================================================================================================
MAIN
====================================================================================================================
*/
void caf_main(actor_system& system, const config& cfg) {
    scoped_actor self{system};

    try {
        sbp::parse_family(cfg.family);
    } catch (const std::invalid_argument& e) {
        self->println("{}, valid families are periodic, implicit and upwind", e.what());
        return;
    }

    study_config conf = study_config::create(cfg.family, cfg.dissipation);
    if (cfg.m_min > 0) conf.m_min = cfg.m_min;
    if (cfg.levels > 0) conf.levels = cfg.levels;
    if (cfg.workers > 0) conf.actor_number = cfg.workers;
    conf.L = cfg.length;
    conf.finalize();

    self->println("Family: {}", conf.family);
    self->println("Dissipation: {}", conf.dissipation);
    self->println("Domain length: {}", conf.L);
    self->println("Grid levels: {} starting at m={}", conf.levels, conf.m_min);
    self->println("Workers: {}", conf.actor_number);

    system.spawn(server, conf);
    self->println("Server actor spawned");
}

CAF_MAIN(caf::id_block::sbp_convergence)
