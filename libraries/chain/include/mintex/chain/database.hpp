#pragma once

#include <mintex/chain/account_object.hpp>
#include <mintex/chain/evaluator_registry.hpp>
#include <mintex/chain/global_property_object.hpp>
#include <mintex/chain/id_generator.hpp>
#include <mintex/chain/nft_objects.hpp>
#include <mintex/chain/operation_notification.hpp>
#include <mintex/protocol/config.hpp>
#include <mintex/protocol/exceptions.hpp>
#include <mintex/protocol/operations.hpp>

#include <chainbase/chainbase.hpp>

#include <fc/signals.hpp>

#include <boost/filesystem/path.hpp>

#include <memory>
#include <vector>

namespace mintex { namespace chain {

    using mintex::protocol::operation;

    /**
     * State of the registry and the exchange. Every caller operation goes
     * through apply_operation(), which runs it inside an undo session: an
     * operation either commits completely or leaves no trace.
     */
    class database : public chainbase::database {
    public:
        database();

        ~database();

        void open(const boost::filesystem::path& data_dir,
            uint64_t shared_file_size = MINTEX_DEFAULT_SHARED_FILE_SIZE,
            const account_name_type& admin = MINTEX_INIT_ADMIN_NAME,
            time_point_sec start_time = time_point_sec());

        void close();

        void wipe(const boost::filesystem::path& data_dir);

        void apply_operation(const operation& op);

        /**
         * Notifications are queued while an operation runs and delivered
         * by on_event once the outermost operation commits.
         */
        void push_event(const operation& op);

        fc::signal<void(const operation_notification&)> on_event;

        /**
         * Raised by pay() after the recipient was credited. A handler may
         * throw payment_refused to refuse, which fails the enclosing
         * operation, or call apply_operation() again.
         */
        fc::signal<void(const payment_notification&)> on_payment;

        /// @{ environment
        const dynamic_global_property_object& get_dynamic_global_properties() const;

        time_point_sec head_block_time() const;

        void set_head_block_time(time_point_sec time);

        void set_entropy_source(std::shared_ptr<entropy_source> source);

        const entropy_source& get_entropy_source() const;
        /// @}

        /// @{ money
        const account_balance_object* find_balance(const account_name_type& account) const;

        share_type get_balance(const account_name_type& account) const;

        void adjust_balance(const account_name_type& account, share_type delta);

        void collect_payment(const account_name_type& from, share_type amount);

        void pay(const account_name_type& recipient, share_type amount);
        /// @}

        /// @{ asset registry
        const nft_collection_object& get_nft_collection(collection_id_type collection_id) const;

        const nft_collection_object* find_nft_collection(collection_id_type collection_id) const;

        const nft_collection_object* find_nft_collection_by_name(const std::string& name) const;

        void throw_if_exists_nft_collection(const std::string& name) const;

        const nft_object& get_nft(token_id_type token_id) const;

        const nft_object* find_nft(token_id_type token_id) const;

        bool nft_exists(token_id_type token_id) const;

        collection_id_type allocate_collection_id(const account_name_type& caller);

        token_id_type allocate_token_id(const account_name_type& caller);
        /// @}

        /// @{ transfer authority
        bool is_authorized(const account_name_type& caller,
            grant_capability capability = grant_capability::transfer_ownership) const;

        void set_authorized(const account_name_type& caller, bool enabled,
            grant_capability capability = grant_capability::transfer_ownership);

        void transfer_nft(const account_name_type& invoker, token_id_type token_id, const account_name_type& new_owner);
        /// @}

        /// @{ exchange engine
        const nft_listing_object& get_nft_listing(token_id_type token_id) const;

        const nft_listing_object* find_nft_listing(token_id_type token_id) const;

        void throw_if_exists_nft_listing(token_id_type token_id) const;

        const nft_auction_object& get_nft_auction(token_id_type token_id) const;

        const nft_auction_object* find_nft_auction(token_id_type token_id) const;

        void throw_if_exists_nft_auction(token_id_type token_id) const;

        void settle_auction(const nft_auction_object& auction);

        void settle_expired_auction_on_bid(const nft_auction_object& auction, const account_name_type& late_bidder);
        /// @}

    private:
        void initialize_indexes();

        void initialize_evaluators();

        void init_genesis(const account_name_type& admin, time_point_sec start_time);

        id_seed make_seed(const account_name_type& caller, id_space space) const;

        void advance_entropy_counter();

        void flush_events();

        evaluator_registry<operation> _evaluator_registry;

        std::shared_ptr<entropy_source> _entropy;

        std::vector<operation> _pending_events;
        uint64_t _event_sequence = 0;
        uint32_t _apply_depth = 0;
    };

} } // mintex::chain
